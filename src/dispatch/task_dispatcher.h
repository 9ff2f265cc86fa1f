#ifndef NODEHUB_BROKER_TASK_DISPATCHER_H
#define NODEHUB_BROKER_TASK_DISPATCHER_H

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

#include "../capability_index.h"
#include "../connection_registry.h"
#include "../helpers/logger.h"
#include "../reactor/handler_interface.h"
#include "node_selector.h"
#include "task.h"


/**
 * Outcome of a dispatch attempt.
 */
struct dispatch_result {
	enum class status {
		/** assigned to a node, the timeout is armed */
		dispatched,
		/** no connected node (other than the requester) has the capability */
		no_capable_node,
		/** the selected node disconnected before the assignment */
		node_unavailable
	};

	std::string task_id;
	status outcome;
	/** Id of the executing node, empty unless dispatched */
	std::string assigned_to;
	/** Reason of the rejection sent to the requester, empty if dispatched */
	std::string error;
};


/**
 * Assigns tasks to nodes with the required capability and tracks them until they complete, fail or time out.
 *
 * Timeouts are measured by the task timer lane. The dispatcher arms and cancels timers by messages sent through
 * the response callback and resolves expirations reported back by the lane. A task has exactly one outcome:
 * whichever of completion and expiration comes first erases it.
 */
class task_dispatcher
{
public:
	/**
	 * @param nodes registry used to check connectivity
	 * @param capabilities index of capable nodes
	 * @param selector strategy choosing among capable nodes
	 * @param default_timeout timeout of tasks which do not carry their own
	 * @param logger optional logger
	 */
	task_dispatcher(std::shared_ptr<connection_registry> nodes,
		std::shared_ptr<capability_index> capabilities,
		std::shared_ptr<node_selector_interface> selector,
		std::chrono::milliseconds default_timeout,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Assign a task to a capable node.
	 * Sends task_assigned to the node and task_dispatched to the requester, or task_error to the requester.
	 * @param from_identity routing id of the requester
	 * @param request the task
	 * @param respond response callback of the calling handler
	 */
	dispatch_result dispatch(
		const std::string &from_identity, const task_request &request, const handler_interface::response_cb &respond);

	/**
	 * Resolve a task by the result reported by its assignee.
	 * Sends task_completed or task_failed to the requester and cancels the timer.
	 * @param from_identity routing id of the reporting node
	 * @param result the reported result
	 * @param respond response callback of the calling handler
	 * @return the finished task, nullptr if the result was dropped (unknown task, already timed out, wrong node)
	 */
	task_ptr complete(
		const std::string &from_identity, const task_result &result, const handler_interface::response_cb &respond);

	/**
	 * Resolve a task whose timer expired. Sends task_timeout to the requester.
	 * @param task_id id of the task
	 * @param respond response callback of the calling handler
	 * @return the timed out task, nullptr if it was already resolved
	 */
	task_ptr expire(const std::string &task_id, const handler_interface::response_cb &respond);

	/**
	 * Tracked task with given id, or nullptr.
	 */
	task_ptr find_task(const std::string &task_id) const;

	/** Number of tasks waiting for an outcome */
	std::size_t get_active_count() const;

	std::size_t get_dispatched_count() const;
	std::size_t get_rejected_count() const;
	std::size_t get_completed_count() const;
	std::size_t get_failed_count() const;
	std::size_t get_timed_out_count() const;

private:
	dispatch_result reject(const std::string &from_identity,
		const std::string &task_id,
		dispatch_result::status outcome,
		const std::string &error,
		const handler_interface::response_cb &respond);

	std::shared_ptr<connection_registry> nodes_;
	std::shared_ptr<capability_index> capabilities_;
	std::shared_ptr<node_selector_interface> selector_;
	std::chrono::milliseconds default_timeout_;
	std::shared_ptr<spdlog::logger> logger_;

	mutable std::mutex mutex_;
	std::map<std::string, task_ptr> tasks_;

	std::size_t dispatched_ = 0;
	std::size_t rejected_ = 0;
	std::size_t completed_ = 0;
	std::size_t failed_ = 0;
	std::size_t timed_out_ = 0;
};

#endif // NODEHUB_BROKER_TASK_DISPATCHER_H
