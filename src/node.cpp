#include "node.h"
#include "helpers/string_to_hex.h"
#include "helpers/timestamp.h"
#include "protocol.h"


std::set<std::string> registration_info::parse_capabilities(const nlohmann::json &payload)
{
	const nlohmann::json *list = &payload;
	if (payload.is_object()) {
		auto it = payload.find("capabilities");
		if (it == payload.end()) {
			return {};
		}
		list = &(*it);
	}

	if (list->is_null()) {
		return {};
	}
	if (!list->is_array()) {
		throw protocol_error("Capabilities must be an array of strings");
	}

	std::set<std::string> result;
	for (auto &item : *list) {
		if (!item.is_string()) {
			throw protocol_error("Capabilities must be an array of strings");
		}
		result.insert(item.get<std::string>());
	}

	return result;
}

registration_info registration_info::from_json(const nlohmann::json &payload)
{
	registration_info info;

	if (payload.is_null()) {
		return info;
	}
	if (!payload.is_object()) {
		throw protocol_error("Registration must be a JSON object");
	}

	auto type = payload.find("type");
	if (type != payload.end() && !type->is_null()) {
		if (!type->is_string()) {
			throw protocol_error("Node type must be a string");
		}
		info.type = type->get<std::string>();
	}

	auto name = payload.find("name");
	if (name != payload.end() && !name->is_null()) {
		if (!name->is_string()) {
			throw protocol_error("Node name must be a string");
		}
		info.name = name->get<std::string>();
	}

	info.capabilities = parse_capabilities(payload);
	return info;
}

node::node(const std::string &identity, const registration_info &info, std::size_t liveness)
	: id(helpers::string_to_hex(identity)), identity(identity), type(info.type), name(info.name),
	  capabilities(info.capabilities), connected_at(std::chrono::system_clock::now()), last_seen(connected_at),
	  liveness(liveness)
{
	if (name.empty()) {
		name = default_name(id);
	}
}

bool node::has_capability(const std::string &capability) const
{
	return capabilities.find(capability) != capabilities.end();
}

nlohmann::json node::to_json() const
{
	return {{"id", id},
		{"type", type},
		{"name", name},
		{"capabilities", capabilities},
		{"connectedAt", helpers::format_timestamp(connected_at)},
		{"lastSeen", helpers::format_timestamp(last_seen)}};
}

std::string node::get_description() const
{
	return name + " (" + id + ")";
}

std::string node::default_name(const std::string &id)
{
	return "node-" + id.substr(0, 8);
}
