#include "message.h"
#include "protocol.h"

namespace
{
	std::string optional_string(const nlohmann::json &source, const char *key)
	{
		auto it = source.find(key);
		if (it == source.end() || it->is_null()) {
			return "";
		}
		if (!it->is_string()) {
			throw protocol_error(std::string("Field '") + key + "' must be a string");
		}
		return it->get<std::string>();
	}
} // namespace

message::message(const std::string &id,
	const std::string &from,
	const std::string &to,
	const std::string &type,
	const nlohmann::json &payload,
	const std::string &timestamp)
	: id(id), from(from), to(to), type(type), payload(payload), timestamp(timestamp)
{
}

nlohmann::json message::to_json() const
{
	nlohmann::json result = {
		{"id", id}, {"from", from}, {"type", type}, {"payload", payload}, {"timestamp", timestamp}};
	if (!to.empty()) {
		result["to"] = to;
	}
	return result;
}

message message::from_json(const nlohmann::json &source)
{
	if (!source.is_object()) {
		throw protocol_error("Message must be a JSON object");
	}

	std::string id = optional_string(source, "id");
	if (id.empty()) {
		throw protocol_error("Message has no id");
	}

	auto payload = source.find("payload");
	return message(id,
		optional_string(source, "from"),
		optional_string(source, "to"),
		optional_string(source, "type"),
		payload == source.end() ? nlohmann::json() : *payload,
		optional_string(source, "timestamp"));
}

message_request message_request::from_json(const nlohmann::json &source)
{
	if (!source.is_object()) {
		throw protocol_error("Message must be a JSON object");
	}

	message_request result;
	result.to = optional_string(source, "to");
	result.type = optional_string(source, "type");
	result.message_id = optional_string(source, "messageId");

	auto payload = source.find("payload");
	if (payload != source.end()) {
		result.payload = *payload;
	}

	return result;
}

bool message_request::is_broadcast() const
{
	return to.empty() || to == protocol::BROADCAST_TOKEN;
}

bool message_request::is_capability_class() const
{
	return to.compare(0, protocol::CAPABILITY_PREFIX.size(), protocol::CAPABILITY_PREFIX) == 0;
}

std::string message_request::get_capability() const
{
	return is_capability_class() ? to.substr(protocol::CAPABILITY_PREFIX.size()) : "";
}
