#ifndef NODEHUB_BROKER_MESSAGE_CONTAINER_H
#define NODEHUB_BROKER_MESSAGE_CONTAINER_H

#include <string>
#include <vector>

/**
 * Message data together with the reactor event key it came from (or goes to) and the identity of the peer.
 * For node and management sockets the identity is the ZeroMQ routing id of the connection.
 */
struct message_container {
	/** Name of the origin or destination */
	std::string key;

	/** Identity of the peer we are communicating with (optional) */
	std::string identity;

	/** Frames of the message */
	std::vector<std::string> data;

	message_container() = default;

	/**
	 * A shorthand constructor for creating a message container in a single expression
	 * @param key name of the origin or destination
	 * @param identity identity of the peer we're communicating with
	 * @param data frames of the message
	 */
	message_container(const std::string &key, const std::string &identity, const std::vector<std::string> &data);

	/**
	 * Frame on given position, or an empty string if the message is shorter.
	 * Optional trailing frames (payloads of argument-less commands) read as empty.
	 */
	const std::string &get_frame(std::size_t index) const;

	/**
	 * Two messages are equal if all their fields are equal
	 */
	bool operator==(const message_container &other) const;
};

#endif // NODEHUB_BROKER_MESSAGE_CONTAINER_H
