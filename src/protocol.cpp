#include "protocol.h"
#include "broker_connect.h"

const std::string protocol::CMD_REGISTER = "register";
const std::string protocol::CMD_CAPABILITIES = "capabilities";
const std::string protocol::CMD_MESSAGE = "message";
const std::string protocol::CMD_TASK = "task";
const std::string protocol::CMD_TASK_RESULT = "task_result";
const std::string protocol::CMD_FETCH_QUEUED = "fetch_queued";
const std::string protocol::CMD_PING = "ping";
const std::string protocol::CMD_DISCONNECT = "disconnect";

const std::string protocol::EVENT_NODE_JOINED = "node_joined";
const std::string protocol::EVENT_NODE_LEFT = "node_left";
const std::string protocol::EVENT_NETWORK_STATUS = "network_status";
const std::string protocol::EVENT_MESSAGE = "message";
const std::string protocol::EVENT_BROADCAST = "broadcast";
const std::string protocol::EVENT_MESSAGE_QUEUED = "message_queued";
const std::string protocol::EVENT_MESSAGE_ROUTED = "message_routed";
const std::string protocol::EVENT_TASK_DISPATCHED = "task_dispatched";
const std::string protocol::EVENT_TASK_ERROR = "task_error";
const std::string protocol::EVENT_TASK_ASSIGNED = "task_assigned";
const std::string protocol::EVENT_TASK_TIMEOUT = "task_timeout";
const std::string protocol::EVENT_TASK_COMPLETED = "task_completed";
const std::string protocol::EVENT_TASK_FAILED = "task_failed";
const std::string protocol::EVENT_REGISTER_ERROR = "register_error";
const std::string protocol::EVENT_ERROR = "error";
const std::string protocol::EVENT_PONG = "pong";
const std::string protocol::EVENT_INTRO = "intro";

const std::string protocol::BROADCAST_TOKEN = "broadcast";
const std::string protocol::CAPABILITY_PREFIX = "type:";

message_container protocol::make_event(
	const std::string &identity, const std::string &event, const nlohmann::json &payload)
{
	return message_container(broker_connect::KEY_NODES, identity, {event, payload.dump()});
}

message_container protocol::make_event(const std::string &identity, const std::string &event)
{
	return message_container(broker_connect::KEY_NODES, identity, {event});
}
