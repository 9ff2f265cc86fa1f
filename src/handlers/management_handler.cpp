#include "management_handler.h"
#include "../broker_connect.h"
#include "../helpers/timestamp.h"

const std::string management_handler::REPLY_OK = "ok";
const std::string management_handler::REPLY_ERROR = "error";
const std::size_t management_handler::DEFAULT_AUDIT_COUNT = 100;

namespace
{
	const std::string &required_argument(const std::vector<std::string> &message, const std::string &what)
	{
		if (message.size() < 2 || message[1].empty()) {
			throw management_error("Missing argument: " + what);
		}
		return message[1];
	}
} // namespace

management_handler::management_handler(std::shared_ptr<connection_registry> nodes,
	std::shared_ptr<capability_index> capabilities,
	std::shared_ptr<message_router> router,
	std::shared_ptr<task_dispatcher> dispatcher,
	std::shared_ptr<offline_queue> queue,
	std::shared_ptr<audit_log> audit,
	std::shared_ptr<spdlog::logger> logger)
	: nodes_(nodes), capabilities_(capabilities), router_(router), dispatcher_(dispatcher), queue_(queue),
	  audit_(audit), logger_(logger), started_(std::chrono::steady_clock::now())
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	commands_.register_command(
		"health", [this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_health(identity, message, cb);
		});

	commands_.register_command("list-nodes",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_list_nodes(identity, message, cb);
		});

	commands_.register_command("list-capabilities",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_list_capabilities(identity, message, cb);
		});

	commands_.register_command("broadcast",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_broadcast(identity, message, cb);
		});

	commands_.register_command("get-queued",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_get_queued(identity, message, cb);
		});

	commands_.register_command("purge-queue",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_purge_queue(identity, message, cb);
		});

	commands_.register_command("get-audit",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_get_audit(identity, message, cb);
		});

	commands_.register_command("get-runtime-stats",
		[this](const std::string &identity, const std::vector<std::string> &message, const response_cb &cb) {
			process_get_runtime_stats(identity, message, cb);
		});
}

void management_handler::on_request(const message_container &message, const response_cb &respond)
{
	if (message.key != broker_connect::KEY_MANAGEMENT) {
		return;
	}

	const std::string &command = message.get_frame(0);
	logger_->debug("Management request '{}'", command);

	std::string error;
	try {
		if (!commands_.call_function(command, message.identity, message.data, respond)) {
			error = "Unknown command '" + command + "'";
		}
	} catch (management_error &e) {
		error = e.what();
	} catch (nlohmann::json::exception &e) {
		error = e.what();
	}

	if (!error.empty()) {
		logger_->warn("Management request '{}' failed: {}", command, error);
		respond(message_container(broker_connect::KEY_MANAGEMENT, message.identity, {REPLY_ERROR, error}));
	}
}

void management_handler::reply(
	const std::string &identity, const nlohmann::json &result, const response_cb &respond) const
{
	respond(message_container(broker_connect::KEY_MANAGEMENT, identity, {REPLY_OK, result.dump()}));
}

void management_handler::process_health(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_);

	reply(identity,
		{{"status", "healthy"},
			{"nodes", nodes_->size()},
			{"uptime", uptime.count()},
			{"timestamp", helpers::timestamp_now()}},
		respond);
}

void management_handler::process_list_nodes(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	nlohmann::json listing = nlohmann::json::array();
	for (auto &item : nodes_->get_nodes()) {
		listing.push_back(item->to_json());
	}

	reply(identity, {{"total", listing.size()}, {"nodes", listing}}, respond);
}

void management_handler::process_list_capabilities(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	nlohmann::json result = nlohmann::json::object();
	for (auto &item : nodes_->get_nodes()) {
		result[item->id] = {{"node", item->name}, {"capabilities", capabilities_->capabilities_of(item->id)}};
	}

	reply(identity, result, respond);
}

void management_handler::process_broadcast(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	nlohmann::json payload;
	try {
		payload = nlohmann::json::parse(required_argument(message, "payload"));
	} catch (nlohmann::json::parse_error &) {
		throw management_error("Broadcast payload is not valid JSON");
	}

	std::size_t delivered = router_->broadcast_external(payload, respond);
	reply(identity,
		{{"status", "broadcast_sent"}, {"delivered", delivered}, {"timestamp", helpers::timestamp_now()}},
		respond);
}

void management_handler::process_get_queued(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	nlohmann::json result = nlohmann::json::array();
	for (auto &queued : queue_->peek(required_argument(message, "node id"))) {
		result.push_back(queued->to_json());
	}

	reply(identity, result, respond);
}

void management_handler::process_purge_queue(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	const std::string &node_id = required_argument(message, "node id");
	std::size_t purged = queue_->purge(node_id);

	logger_->info("Offline queue of {} purged ({} messages)", node_id, purged);
	reply(identity, {{"nodeId", node_id}, {"purged", purged}}, respond);
}

void management_handler::process_get_audit(
	const std::string &identity, const std::vector<std::string> &message, const response_cb &respond)
{
	std::size_t count = DEFAULT_AUDIT_COUNT;
	if (message.size() >= 2 && !message[1].empty()) {
		try {
			count = std::stoul(message[1]);
		} catch (std::logic_error &) {
			throw management_error("Invalid entry count '" + message[1] + "'");
		}
	}

	reply(identity, audit_->recent(count), respond);
}

void management_handler::process_get_runtime_stats(
	const std::string &identity, const std::vector<std::string> &, const response_cb &respond)
{
	reply(identity,
		{{"nodes", nodes_->size()},
			{"capabilities", capabilities_->get_capabilities().size()},
			{"queued-messages", queue_->get_queued_count()},
			{"routed-messages", router_->get_routed_count()},
			{"offline-deliveries", router_->get_queued_count()},
			{"audited-messages", audit_->get_recorded_count()},
			{"active-tasks", dispatcher_->get_active_count()},
			{"dispatched-tasks", dispatcher_->get_dispatched_count()},
			{"rejected-tasks", dispatcher_->get_rejected_count()},
			{"completed-tasks", dispatcher_->get_completed_count()},
			{"failed-tasks", dispatcher_->get_failed_count()},
			{"timed-out-tasks", dispatcher_->get_timed_out_count()}},
		respond);
}
