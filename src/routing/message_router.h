#ifndef NODEHUB_BROKER_MESSAGE_ROUTER_H
#define NODEHUB_BROKER_MESSAGE_ROUTER_H

#include <memory>
#include <mutex>

#include "../capability_index.h"
#include "../connection_registry.h"
#include "../helpers/logger.h"
#include "../message.h"
#include "../queuing/offline_queue.h"
#include "../reactor/handler_interface.h"
#include "../store/audit_log.h"


/**
 * How a message was routed.
 */
struct route_result {
	enum class route_kind { broadcast, capability, direct, queued };

	route_kind kind;
	/** Number of nodes the message was sent to */
	std::size_t delivered;
	/** The stamped message */
	message_ptr routed;
};


/**
 * Delivers messages by their destination: every connected node, every node with a capability,
 * one node, or the offline queue of a node which is not connected.
 * Delivery is fire-and-forget, every routed message ends up in the audit trail.
 */
class message_router
{
public:
	/**
	 * @param nodes registry of connected nodes
	 * @param capabilities index used for "type:<capability>" destinations
	 * @param queue offline queue for absent destinations
	 * @param audit trail of routed messages
	 * @param logger optional logger
	 */
	message_router(std::shared_ptr<connection_registry> nodes,
		std::shared_ptr<capability_index> capabilities,
		std::shared_ptr<offline_queue> queue,
		std::shared_ptr<audit_log> audit,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Route a message sent by a node.
	 * The sender gets message_routed for capability destinations and message_queued when the message was queued.
	 * @param from_identity routing id of the sender
	 * @param request the message as sent
	 * @param respond response callback of the calling handler
	 */
	route_result route(const std::string &from_identity,
		const message_request &request,
		const handler_interface::response_cb &respond);

	/**
	 * Send a broadcast event with given payload to every connected node.
	 * @return number of nodes reached
	 */
	std::size_t broadcast_external(const nlohmann::json &payload, const handler_interface::response_cb &respond);

	/**
	 * Send all queued messages of a connected node to it, in FIFO order.
	 * @param identity routing id of the node
	 * @return number of delivered messages
	 */
	std::size_t deliver_queued(const std::string &identity, const handler_interface::response_cb &respond);

	/** Messages sent to at least one node since start */
	std::size_t get_routed_count() const;

	/** Messages put to the offline queue since start */
	std::size_t get_queued_count() const;

private:
	std::size_t send_to_all(const std::string &except, const std::string &event, const nlohmann::json &payload,
		const handler_interface::response_cb &respond);

	std::shared_ptr<connection_registry> nodes_;
	std::shared_ptr<capability_index> capabilities_;
	std::shared_ptr<offline_queue> queue_;
	std::shared_ptr<audit_log> audit_;
	std::shared_ptr<spdlog::logger> logger_;

	mutable std::mutex mutex_;
	std::size_t routed_ = 0;
	std::size_t queued_ = 0;
};

#endif // NODEHUB_BROKER_MESSAGE_ROUTER_H
