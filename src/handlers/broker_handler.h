#ifndef NODEHUB_BROKER_BROKER_HANDLER_H
#define NODEHUB_BROKER_BROKER_HANDLER_H

#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "../config/broker_config.h"
#include "../connection_registry.h"
#include "../dispatch/task_dispatcher.h"
#include "../notifier/event_notifier.h"
#include "../reactor/command_holder.h"
#include "../reactor/handler_interface.h"
#include "../routing/message_router.h"

/**
 * Processes frames from nodes, keeps track of their liveness and resolves expired tasks.
 */
class broker_handler : public handler_interface
{
public:
	/**
	 * @param config broker configuration
	 * @param nodes node registry (it's acceptable if it already contains some nodes)
	 * @param router router of node messages
	 * @param dispatcher dispatcher of tasks
	 * @param logger an optional logger
	 */
	broker_handler(std::shared_ptr<const broker_config> config,
		std::shared_ptr<connection_registry> nodes,
		std::shared_ptr<message_router> router,
		std::shared_ptr<task_dispatcher> dispatcher,
		std::shared_ptr<spdlog::logger> logger);

	void on_request(const message_container &message, const response_cb &respond) override;

private:
	std::shared_ptr<const broker_config> config_;
	std::shared_ptr<connection_registry> nodes_;
	std::shared_ptr<message_router> router_;
	std::shared_ptr<task_dispatcher> dispatcher_;
	std::shared_ptr<spdlog::logger> logger_;

	/** Time since we last heard from each node or decreased its liveness */
	std::map<std::string, std::chrono::milliseconds> node_timers_;

	/** Handlers for commands received from the nodes */
	command_holder node_commands_;

	/**
	 * Process a "register" request. The connection becomes a node (or updates its registration), other nodes
	 * learn about it and it receives the network status followed by its queued messages.
	 */
	void process_register(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "capabilities" frame, replacing capabilities of a registered node.
	 */
	void process_capabilities(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "message" frame, the message is routed by its destination.
	 */
	void process_message(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "task" request, the task is dispatched to a capable node.
	 */
	void process_task(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "task_result" frame from the node which executed a task.
	 */
	void process_task_result(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "fetch_queued" request, queued messages of the node are delivered.
	 */
	void process_fetch_queued(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "ping". Registered nodes get "pong", unknown connections "intro" so that they register.
	 */
	void process_ping(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a "disconnect" frame, the node is evicted.
	 */
	void process_disconnect(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/**
	 * Process a message about elapsed time from the reactor.
	 * If we haven't heard from a node in a ping interval, we decrease its liveness counter. When this counter
	 * reaches zero, the node is considered gone and evicted.
	 */
	void process_timer(const message_container &message, const response_cb &respond);

	/**
	 * Process a task expiration reported by the task timer lane.
	 */
	void process_task_expired(const message_container &message, const response_cb &respond);

	/**
	 * Remove a node and tell the others.
	 * @param node_id id of the node
	 * @param reason logged cause of the eviction
	 */
	void evict_node(const std::string &node_id, const std::string &reason, const response_cb &respond);

	/**
	 * Parse the payload frame of a request.
	 * @return parsed JSON, null if the frame is missing or empty
	 * @throws protocol_error if the frame is not valid JSON
	 */
	nlohmann::json parse_payload(const std::vector<std::string> &message) const;

	/**
	 * Notifier matching the configuration: webhook through the reactor, or nothing.
	 */
	std::unique_ptr<event_notifier_interface> create_notifier(const response_cb &respond) const;
};

#endif // NODEHUB_BROKER_BROKER_HANDLER_H
