#include "task_dispatcher.h"
#include "../broker_connect.h"
#include "../handlers/task_timer_handler.h"
#include "../helpers/string_to_hex.h"
#include "../helpers/uuid.h"
#include "../protocol.h"


task_dispatcher::task_dispatcher(std::shared_ptr<connection_registry> nodes,
	std::shared_ptr<capability_index> capabilities,
	std::shared_ptr<node_selector_interface> selector,
	std::chrono::milliseconds default_timeout,
	std::shared_ptr<spdlog::logger> logger)
	: nodes_(nodes), capabilities_(capabilities), selector_(selector), default_timeout_(default_timeout),
	  logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
	if (selector_ == nullptr) {
		selector_ = std::make_shared<random_node_selector>();
	}
}

dispatch_result task_dispatcher::reject(const std::string &from_identity,
	const std::string &task_id,
	dispatch_result::status outcome,
	const std::string &error,
	const handler_interface::response_cb &respond)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		++rejected_;
	}

	logger_->info("Task {} rejected: {}", task_id, error);
	respond(protocol::make_event(from_identity, protocol::EVENT_TASK_ERROR, {{"taskId", task_id}, {"error", error}}));
	return {task_id, outcome, "", error};
}

dispatch_result task_dispatcher::dispatch(
	const std::string &from_identity, const task_request &request, const handler_interface::response_cb &respond)
{
	std::string task_id = helpers::generate_uuid();
	std::string from = helpers::string_to_hex(from_identity);

	std::vector<std::string> candidates;
	for (auto &id : capabilities_->nodes_with(request.capability)) {
		if (id != from) {
			candidates.push_back(id);
		}
	}

	if (candidates.empty()) {
		return reject(from_identity,
			task_id,
			dispatch_result::status::no_capable_node,
			"No nodes available with capability: " + request.capability,
			respond);
	}

	std::string selected = selector_->select(candidates);
	node_ptr target = nodes_->lookup(selected);
	if (target == nullptr) {
		return reject(
			from_identity, task_id, dispatch_result::status::node_unavailable, "Selected node not available", respond);
	}

	auto timeout = request.has_timeout() ? request.timeout : default_timeout_;
	auto dispatched = std::make_shared<task>(task_id, request, timeout, from_identity, target->id);

	{
		std::lock_guard<std::mutex> lock(mutex_);
		tasks_.emplace(task_id, dispatched);
		++dispatched_;
	}

	respond(protocol::make_event(target->identity, protocol::EVENT_TASK_ASSIGNED, dispatched->to_assignment_json()));
	respond(protocol::make_event(
		from_identity, protocol::EVENT_TASK_DISPATCHED, {{"taskId", task_id}, {"assignedTo", target->id}}));
	respond(message_container(broker_connect::KEY_TASK_TIMER,
		"",
		{task_timer_handler::CMD_ARM, task_id, std::to_string(timeout.count())}));

	logger_->info("Task {} ({}) dispatched to {}", task_id, request.capability, target->get_description());
	return {task_id, dispatch_result::status::dispatched, target->id, ""};
}

task_ptr task_dispatcher::complete(
	const std::string &from_identity, const task_result &result, const handler_interface::response_cb &respond)
{
	std::string reporter = helpers::string_to_hex(from_identity);
	task_ptr finished;

	{
		std::lock_guard<std::mutex> lock(mutex_);

		auto it = tasks_.find(result.task_id);
		if (it == tasks_.end()) {
			logger_->warn("Result of unknown or already resolved task {} dropped", result.task_id);
			return nullptr;
		}
		if (it->second->assigned_to != reporter) {
			logger_->warn("Result of task {} from {} dropped, it is assigned to {}",
				result.task_id,
				reporter,
				it->second->assigned_to);
			return nullptr;
		}

		finished = it->second;
		tasks_.erase(it);
		finished->state = result.succeeded ? task_state::completed : task_state::failed;
		if (result.succeeded) {
			++completed_;
		} else {
			++failed_;
		}
	}

	respond(message_container(broker_connect::KEY_TASK_TIMER, "", {task_timer_handler::CMD_CANCEL, result.task_id}));

	nlohmann::json notification = {{"taskId", finished->task_id}, {"assignedTo", finished->assigned_to}};
	if (result.succeeded) {
		notification["result"] = result.result;
		respond(protocol::make_event(finished->from_identity, protocol::EVENT_TASK_COMPLETED, notification));
		logger_->info("Task {} completed by {}", finished->task_id, finished->assigned_to);
	} else {
		notification["error"] = result.error;
		respond(protocol::make_event(finished->from_identity, protocol::EVENT_TASK_FAILED, notification));
		logger_->info("Task {} failed on {}: {}", finished->task_id, finished->assigned_to, result.error);
	}

	return finished;
}

task_ptr task_dispatcher::expire(const std::string &task_id, const handler_interface::response_cb &respond)
{
	task_ptr expired;

	{
		std::lock_guard<std::mutex> lock(mutex_);

		auto it = tasks_.find(task_id);
		if (it == tasks_.end()) {
			// resolved before the timer fired
			return nullptr;
		}

		expired = it->second;
		tasks_.erase(it);
		expired->state = task_state::timed_out;
		++timed_out_;
	}

	respond(protocol::make_event(expired->from_identity, protocol::EVENT_TASK_TIMEOUT, {{"taskId", task_id}}));
	logger_->warn("Task {} assigned to {} timed out after {} ms",
		task_id,
		expired->assigned_to,
		static_cast<long long>(expired->timeout.count()));

	return expired;
}

task_ptr task_dispatcher::find_task(const std::string &task_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = tasks_.find(task_id);
	return it == tasks_.end() ? nullptr : it->second;
}

std::size_t task_dispatcher::get_active_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return tasks_.size();
}

std::size_t task_dispatcher::get_dispatched_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return dispatched_;
}

std::size_t task_dispatcher::get_rejected_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return rejected_;
}

std::size_t task_dispatcher::get_completed_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return completed_;
}

std::size_t task_dispatcher::get_failed_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return failed_;
}

std::size_t task_dispatcher::get_timed_out_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return timed_out_;
}
