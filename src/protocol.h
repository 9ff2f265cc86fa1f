#ifndef NODEHUB_BROKER_PROTOCOL_H
#define NODEHUB_BROKER_PROTOCOL_H

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "reactor/message_container.h"


/**
 * Names of frames exchanged with nodes.
 * Every frame from a node is [command, json payload], every frame to a node is [event, json payload].
 */
class protocol
{
public:
	/** node -> broker commands */
	static const std::string CMD_REGISTER;
	static const std::string CMD_CAPABILITIES;
	static const std::string CMD_MESSAGE;
	static const std::string CMD_TASK;
	static const std::string CMD_TASK_RESULT;
	static const std::string CMD_FETCH_QUEUED;
	static const std::string CMD_PING;
	static const std::string CMD_DISCONNECT;

	/** broker -> node events */
	static const std::string EVENT_NODE_JOINED;
	static const std::string EVENT_NODE_LEFT;
	static const std::string EVENT_NETWORK_STATUS;
	static const std::string EVENT_MESSAGE;
	static const std::string EVENT_BROADCAST;
	static const std::string EVENT_MESSAGE_QUEUED;
	static const std::string EVENT_MESSAGE_ROUTED;
	static const std::string EVENT_TASK_DISPATCHED;
	static const std::string EVENT_TASK_ERROR;
	static const std::string EVENT_TASK_ASSIGNED;
	static const std::string EVENT_TASK_TIMEOUT;
	static const std::string EVENT_TASK_COMPLETED;
	static const std::string EVENT_TASK_FAILED;
	static const std::string EVENT_REGISTER_ERROR;
	static const std::string EVENT_ERROR;
	static const std::string EVENT_PONG;
	static const std::string EVENT_INTRO;

	/** Destination meaning all connected nodes except the sender */
	static const std::string BROADCAST_TOKEN;
	/** Prefix of destinations addressing every node with a capability */
	static const std::string CAPABILITY_PREFIX;

	/**
	 * Build a frame for the node socket.
	 * @param identity routing id of the receiving connection
	 * @param event name of the event
	 * @param payload serialized as the second frame
	 */
	static message_container make_event(
		const std::string &identity, const std::string &event, const nlohmann::json &payload);

	/**
	 * Build a frame without payload for the node socket.
	 */
	static message_container make_event(const std::string &identity, const std::string &event);
};


/**
 * Thrown when a frame from a node cannot be understood (bad JSON, missing or mistyped fields).
 * Reported back to the sender as an error event, never fatal.
 */
class protocol_error : public std::runtime_error
{
public:
	explicit protocol_error(const std::string &msg) : std::runtime_error(msg)
	{
	}
};

#endif // NODEHUB_BROKER_PROTOCOL_H
