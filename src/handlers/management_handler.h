#ifndef NODEHUB_BROKER_MANAGEMENT_HANDLER_H
#define NODEHUB_BROKER_MANAGEMENT_HANDLER_H

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "../capability_index.h"
#include "../connection_registry.h"
#include "../dispatch/task_dispatcher.h"
#include "../queuing/offline_queue.h"
#include "../reactor/command_holder.h"
#include "../reactor/handler_interface.h"
#include "../routing/message_router.h"
#include "../store/audit_log.h"

/**
 * Answers requests of operators on the management socket.
 *
 * Requests are [command, args...], replies ["ok", json] or ["error", description].
 */
class management_handler : public handler_interface
{
public:
	static const std::string REPLY_OK;
	static const std::string REPLY_ERROR;

	/** Number of audit entries returned when the request does not say */
	static const std::size_t DEFAULT_AUDIT_COUNT;

	management_handler(std::shared_ptr<connection_registry> nodes,
		std::shared_ptr<capability_index> capabilities,
		std::shared_ptr<message_router> router,
		std::shared_ptr<task_dispatcher> dispatcher,
		std::shared_ptr<offline_queue> queue,
		std::shared_ptr<audit_log> audit,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	void on_request(const message_container &message, const response_cb &respond) override;

private:
	std::shared_ptr<connection_registry> nodes_;
	std::shared_ptr<capability_index> capabilities_;
	std::shared_ptr<message_router> router_;
	std::shared_ptr<task_dispatcher> dispatcher_;
	std::shared_ptr<offline_queue> queue_;
	std::shared_ptr<audit_log> audit_;
	std::shared_ptr<spdlog::logger> logger_;

	std::chrono::steady_clock::time_point started_;

	command_holder commands_;

	void reply(const std::string &identity, const nlohmann::json &result, const response_cb &respond) const;

	/** {status, nodes, uptime, timestamp} */
	void process_health(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/** {total, nodes[]} */
	void process_list_nodes(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/** node id -> {node, capabilities[]} */
	void process_list_capabilities(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	/** broadcast event with the given JSON payload to every node */
	void process_broadcast(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	void process_get_queued(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	void process_purge_queue(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	void process_get_audit(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);

	void process_get_runtime_stats(
		const std::string &identity, const std::vector<std::string> &message, const response_cb &respond);
};


/**
 * Invalid management request, the description is sent back in the error reply.
 */
class management_error : public std::runtime_error
{
public:
	explicit management_error(const std::string &msg) : std::runtime_error(msg)
	{
	}
};

#endif // NODEHUB_BROKER_MANAGEMENT_HANDLER_H
