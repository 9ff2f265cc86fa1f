#include "reactor_event_notifier.h"
#include "../handlers/event_notifier_handler.h"

reactor_event_notifier::reactor_event_notifier(handler_interface::response_cb callback, const std::string &key)
	: callback_(callback), key_(key)
{
}

void reactor_event_notifier::error(const std::string &desc)
{
	callback_(message_container(key_, "", {"type", event_notifier_handler::TYPE_ERROR, "message", desc}));
}

void reactor_event_notifier::node_online(const std::string &node_id, const std::string &name)
{
	callback_(message_container(key_,
		"",
		{"type", event_notifier_handler::TYPE_NODE_STATUS, "id", node_id, "status", "online", "name", name}));
}

void reactor_event_notifier::node_offline(const std::string &node_id, const std::string &name)
{
	callback_(message_container(key_,
		"",
		{"type", event_notifier_handler::TYPE_NODE_STATUS, "id", node_id, "status", "offline", "name", name}));
}

void reactor_event_notifier::task_status(
	const std::string &task_id, const std::string &status, const std::string &desc)
{
	std::vector<std::string> frames = {
		"type", event_notifier_handler::TYPE_TASK_STATUS, "id", task_id, "status", status};
	if (!desc.empty()) {
		frames.push_back("message");
		frames.push_back(desc);
	}

	callback_(message_container(key_, "", frames));
}
