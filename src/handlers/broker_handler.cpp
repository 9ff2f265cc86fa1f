#include "broker_handler.h"
#include "../broker_connect.h"
#include "../helpers/string_to_hex.h"
#include "../notifier/empty_event_notifier.h"
#include "../notifier/reactor_event_notifier.h"
#include "../protocol.h"

#include <vector>

broker_handler::broker_handler(std::shared_ptr<const broker_config> config,
	std::shared_ptr<connection_registry> nodes,
	std::shared_ptr<message_router> router,
	std::shared_ptr<task_dispatcher> dispatcher,
	std::shared_ptr<spdlog::logger> logger)
	: config_(config), nodes_(nodes), router_(router), dispatcher_(dispatcher), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	node_commands_.register_command(protocol::CMD_REGISTER,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_register(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_CAPABILITIES,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_capabilities(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_MESSAGE,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_message(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_TASK,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_task(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_TASK_RESULT,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_task_result(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_FETCH_QUEUED,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_fetch_queued(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_PING,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_ping(identity, message, respond);
		});

	node_commands_.register_command(protocol::CMD_DISCONNECT,
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &respond) {
			process_disconnect(identity, message, respond);
		});
}

void broker_handler::on_request(const message_container &message, const response_cb &respond)
{
	if (message.key == broker_connect::KEY_NODES) {
		if (message.data.empty()) {
			logger_->warn("Empty frame from connection {} ignored", helpers::string_to_hex(message.identity));
			return;
		}

		std::string node_id = helpers::string_to_hex(message.identity);
		if (nodes_->touch(node_id)) {
			node_timers_[node_id] = std::chrono::milliseconds(0);
		}

		const std::string &command = message.data.front();

		try {
			if (!node_commands_.call_function(command, message.identity, message.data, respond)) {
				throw protocol_error("Unknown command '" + command + "'");
			}
		} catch (protocol_error &e) {
			logger_->warn("Malformed '{}' frame from {}: {}", command, node_id, e.what());
			respond(protocol::make_event(message.identity, protocol::EVENT_ERROR, {{"error", e.what()}}));
		} catch (nlohmann::json::exception &e) {
			logger_->warn("Malformed '{}' frame from {}: {}", command, node_id, e.what());
			respond(protocol::make_event(message.identity, protocol::EVENT_ERROR, {{"error", e.what()}}));
		}
	}

	if (message.key == broker_connect::KEY_TASK_EXPIRED) {
		process_task_expired(message, respond);
	}

	if (message.key == broker_connect::KEY_TIMER) {
		process_timer(message, respond);
	}
}

nlohmann::json broker_handler::parse_payload(const std::vector<std::string> &message) const
{
	if (message.size() < 2 || message[1].empty()) {
		return nlohmann::json();
	}

	try {
		return nlohmann::json::parse(message[1]);
	} catch (nlohmann::json::parse_error &e) {
		throw protocol_error("Payload is not valid JSON: " + std::string(e.what()));
	}
}

std::unique_ptr<event_notifier_interface> broker_handler::create_notifier(const response_cb &respond) const
{
	if (config_->get_notifier_config().enabled()) {
		return std::unique_ptr<event_notifier_interface>(
			new reactor_event_notifier(respond, broker_connect::KEY_EVENT_NOTIFIER));
	}
	return std::unique_ptr<event_notifier_interface>(new empty_event_notifier());
}

void broker_handler::process_register(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	registration_info info = registration_info::from_json(parse_payload(message));
	registration_result result = nodes_->register_node(identity, info);

	if (!result.accepted) {
		logger_->warn("Repeated registration of {} rejected", result.registered->get_description());
		respond(protocol::make_event(
			identity, protocol::EVENT_REGISTER_ERROR, {{"error", "Node already registered on this connection"}}));
		return;
	}

	node_ptr registered = result.registered;
	node_timers_[registered->id] = std::chrono::milliseconds(0);

	if (result.replaced) {
		logger_->info("Node {} updated its registration (type {})", registered->get_description(), registered->type);
	} else {
		logger_->info("Node {} registered (type {})", registered->get_description(), registered->type);
	}
	for (auto &capability : registered->capabilities) {
		logger_->debug(" - capability {}", capability);
	}

	nlohmann::json snapshot = registered->to_json();
	nlohmann::json listing = nlohmann::json::array();

	for (auto &other : nodes_->get_nodes()) {
		listing.push_back(other->to_json());
		if (other->id != registered->id) {
			respond(protocol::make_event(other->identity, protocol::EVENT_NODE_JOINED, snapshot));
		}
	}

	respond(protocol::make_event(
		identity, protocol::EVENT_NETWORK_STATUS, {{"totalNodes", listing.size()}, {"nodes", listing}}));

	create_notifier(respond)->node_online(registered->id, registered->name);

	if (config_->get_deliver_queued_on_register()) {
		router_->deliver_queued(identity, respond);
	}
}

void broker_handler::process_capabilities(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &)
{
	std::string node_id = helpers::string_to_hex(identity);
	auto capabilities = registration_info::parse_capabilities(parse_payload(message));

	if (!nodes_->update_capabilities(node_id, capabilities)) {
		logger_->warn("Capabilities from unregistered connection {} ignored", node_id);
		return;
	}

	logger_->info("Node {} now advertises {} capabilities", node_id, capabilities.size());
}

void broker_handler::process_message(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	router_->route(identity, message_request::from_json(parse_payload(message)), respond);
}

void broker_handler::process_task(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	task_request request = task_request::from_json(parse_payload(message));
	dispatch_result result = dispatcher_->dispatch(identity, request, respond);

	auto notifier = create_notifier(respond);
	if (result.outcome == dispatch_result::status::dispatched) {
		notifier->task_status(result.task_id, task_state_to_string(task_state::dispatched), result.assigned_to);
	} else {
		notifier->task_status(result.task_id, "REJECTED", result.error);
	}
}

void broker_handler::process_task_result(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	task_result result = task_result::from_json(parse_payload(message));
	task_ptr finished = dispatcher_->complete(identity, result, respond);

	if (finished != nullptr) {
		create_notifier(respond)->task_status(finished->task_id, task_state_to_string(finished->state), result.error);
	}
}

void broker_handler::process_fetch_queued(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	router_->deliver_queued(identity, respond);
}

void broker_handler::process_ping(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	if (nodes_->find_by_identity(identity) == nullptr) {
		respond(protocol::make_event(identity, protocol::EVENT_INTRO));
		return;
	}

	respond(protocol::make_event(identity, protocol::EVENT_PONG));
}

void broker_handler::process_disconnect(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	evict_node(helpers::string_to_hex(identity), "disconnected", respond);
}

void broker_handler::evict_node(const std::string &node_id, const std::string &reason, const response_cb &respond)
{
	node_timers_.erase(node_id);

	node_ptr removed = nodes_->evict(node_id);
	if (removed == nullptr) {
		logger_->debug("Connection {} {} without registration", node_id, reason);
		return;
	}

	logger_->info("Node {} {}", removed->get_description(), reason);

	nlohmann::json snapshot = removed->to_json();
	for (auto &other : nodes_->get_nodes()) {
		respond(protocol::make_event(other->identity, protocol::EVENT_NODE_LEFT, snapshot));
	}

	create_notifier(respond)->node_offline(removed->id, removed->name);
}

void broker_handler::process_timer(const message_container &message, const response_cb &respond)
{
	if (message.data.empty()) {
		return;
	}

	std::chrono::milliseconds time;
	try {
		time = std::chrono::milliseconds(std::stoll(message.data.front()));
	} catch (std::logic_error &) {
		logger_->warn("Invalid timer message '{}' ignored", message.data.front());
		return;
	}

	std::vector<std::string> to_remove;

	for (auto &node : nodes_->get_nodes()) {
		auto &timer = node_timers_[node->id];
		timer += time;

		if (timer > config_->get_node_ping_interval()) {
			timer = std::chrono::milliseconds(0);

			if (nodes_->decrease_liveness(node->id) == 0) {
				to_remove.push_back(node->id);
			}
		}
	}

	for (auto &node_id : to_remove) {
		evict_node(node_id, "expired", respond);
	}
}

void broker_handler::process_task_expired(const message_container &message, const response_cb &respond)
{
	if (message.data.empty()) {
		return;
	}

	task_ptr expired = dispatcher_->expire(message.data.front(), respond);
	if (expired != nullptr) {
		create_notifier(respond)->task_status(
			expired->task_id, task_state_to_string(task_state::timed_out), "Assigned to " + expired->assigned_to);
	}
}
