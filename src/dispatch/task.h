#ifndef NODEHUB_BROKER_TASK_H
#define NODEHUB_BROKER_TASK_H

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>


/**
 * Lifecycle of a dispatched task. Every state but dispatched is terminal.
 */
enum class task_state { dispatched, completed, failed, timed_out };

/**
 * Name of the state as reported to the event webhook (DISPATCHED, COMPLETED, FAILED, TIMED_OUT).
 */
std::string task_state_to_string(task_state state);


/**
 * Task as requested by a node.
 */
struct task_request {
	/** Required capability of the executing node */
	std::string capability;
	nlohmann::json payload;
	std::string priority = "normal";
	/** Negative if the frame carries no timeout, zero expires on the next timer tick */
	std::chrono::milliseconds timeout = std::chrono::milliseconds(-1);

	/** True if the requester chose its own timeout */
	bool has_timeout() const
	{
		return timeout.count() >= 0;
	}

	/**
	 * Read the payload of a task frame {capability, payload?, priority?, timeoutMs?}.
	 * @throws protocol_error when the capability is missing or a field has a wrong type
	 */
	static task_request from_json(const nlohmann::json &source);
};


/**
 * Result of a task reported by the node which executed it.
 */
struct task_result {
	std::string task_id;
	/** False if the node reported a failure */
	bool succeeded = true;
	nlohmann::json result;
	std::string error;

	/**
	 * Read the payload of a task_result frame {taskId, status: "completed"|"failed", result?, error?}.
	 * @throws protocol_error when taskId is missing or the status is unknown
	 */
	static task_result from_json(const nlohmann::json &source);
};


/**
 * A task the broker dispatched and still tracks.
 */
class task
{
public:
	const std::string task_id;
	const std::string capability;
	const nlohmann::json payload;
	const std::string priority;
	const std::chrono::milliseconds timeout;
	/** Requesting node */
	const std::string from;
	/** Routing id of the requester, notifications go there */
	const std::string from_identity;
	/** Node executing the task */
	const std::string assigned_to;
	const std::string timestamp;

	task_state state = task_state::dispatched;

	task(const std::string &task_id,
		const task_request &request,
		std::chrono::milliseconds timeout,
		const std::string &from_identity,
		const std::string &assigned_to);

	/**
	 * Payload of the task_assigned event {taskId, capability, payload, priority, from, timestamp}.
	 */
	nlohmann::json to_assignment_json() const;
};

typedef std::shared_ptr<task> task_ptr;

#endif // NODEHUB_BROKER_TASK_H
