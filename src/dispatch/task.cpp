#include "task.h"
#include "../helpers/string_to_hex.h"
#include "../helpers/timestamp.h"
#include "../protocol.h"


std::string task_state_to_string(task_state state)
{
	switch (state) {
	case task_state::dispatched: return "DISPATCHED";
	case task_state::completed: return "COMPLETED";
	case task_state::failed: return "FAILED";
	case task_state::timed_out: return "TIMED_OUT";
	}
	return "UNKNOWN";
}

task_request task_request::from_json(const nlohmann::json &source)
{
	if (!source.is_object()) {
		throw protocol_error("Task must be a JSON object");
	}

	task_request result;

	auto capability = source.find("capability");
	if (capability == source.end() || !capability->is_string() || capability->get<std::string>().empty()) {
		throw protocol_error("Task has no capability");
	}
	result.capability = capability->get<std::string>();

	auto payload = source.find("payload");
	if (payload != source.end()) {
		result.payload = *payload;
	}

	auto priority = source.find("priority");
	if (priority != source.end() && !priority->is_null()) {
		if (!priority->is_string()) {
			throw protocol_error("Task priority must be a string");
		}
		result.priority = priority->get<std::string>();
	}

	auto timeout = source.find("timeoutMs");
	if (timeout == source.end()) {
		timeout = source.find("timeout");
	}
	if (timeout != source.end() && !timeout->is_null()) {
		if (!timeout->is_number_integer() || timeout->get<long long>() < 0) {
			throw protocol_error("Task timeout must be a non-negative number of milliseconds");
		}
		result.timeout = std::chrono::milliseconds(timeout->get<long long>());
	}

	return result;
}

task_result task_result::from_json(const nlohmann::json &source)
{
	if (!source.is_object()) {
		throw protocol_error("Task result must be a JSON object");
	}

	task_result result;

	auto id = source.find("taskId");
	if (id == source.end() || !id->is_string()) {
		throw protocol_error("Task result has no taskId");
	}
	result.task_id = id->get<std::string>();

	auto status = source.find("status");
	if (status != source.end() && !status->is_null()) {
		std::string value = status->is_string() ? status->get<std::string>() : "";
		if (value == "failed") {
			result.succeeded = false;
		} else if (value != "completed") {
			throw protocol_error("Task result status must be 'completed' or 'failed'");
		}
	}

	auto data = source.find("result");
	if (data != source.end()) {
		result.result = *data;
	}

	auto error = source.find("error");
	if (error != source.end() && !error->is_null()) {
		result.error = error->is_string() ? error->get<std::string>() : error->dump();
	}

	return result;
}

task::task(const std::string &task_id,
	const task_request &request,
	std::chrono::milliseconds timeout,
	const std::string &from_identity,
	const std::string &assigned_to)
	: task_id(task_id), capability(request.capability), payload(request.payload), priority(request.priority),
	  timeout(timeout), from(helpers::string_to_hex(from_identity)), from_identity(from_identity),
	  assigned_to(assigned_to), timestamp(helpers::timestamp_now())
{
}

nlohmann::json task::to_assignment_json() const
{
	return {{"taskId", task_id},
		{"capability", capability},
		{"payload", payload},
		{"priority", priority},
		{"from", from},
		{"timestamp", timestamp}};
}
