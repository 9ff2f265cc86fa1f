#ifndef NODEHUB_BROKER_BROKER_CONNECT_H
#define NODEHUB_BROKER_BROKER_CONNECT_H

#include <memory>
#include <spdlog/logger.h>
#include <zmq.hpp>

#include "capability_index.h"
#include "config/broker_config.h"
#include "connection_registry.h"
#include "dispatch/task_dispatcher.h"
#include "queuing/offline_queue.h"
#include "reactor/reactor.h"
#include "routing/message_router.h"
#include "store/audit_log.h"

/**
 * Wires the node and management sockets, the handlers and their asynchronous lanes into one reactor.
 */
class broker_connect
{
private:
	/** Loaded broker configuration. */
	std::shared_ptr<const broker_config> config_;
	/** System logger. */
	std::shared_ptr<spdlog::logger> logger_;
	/** Registry of registered nodes. */
	std::shared_ptr<connection_registry> nodes_;
	std::shared_ptr<message_router> router_;
	std::shared_ptr<task_dispatcher> dispatcher_;
	/** A reactor that provides us with an event-based API to communicate with nodes and operators */
	reactor reactor_;

public:
	/** A string key for the socket nodes connect to */
	static const std::string KEY_NODES;

	/** A string key for the socket operators connect to */
	static const std::string KEY_MANAGEMENT;

	/** A string key for messages for the webhook notifier */
	static const std::string KEY_EVENT_NOTIFIER;

	/** A string key for messages arming and cancelling task timers */
	static const std::string KEY_TASK_TIMER;

	/** A string key for expirations reported by the task timer lane */
	static const std::string KEY_TASK_EXPIRED;

	/** A string key for messages about time elapsed in the poll loop */
	static const std::string KEY_TIMER;

	/**
	 * @param config a configuration object used to set up the connections
	 * @param context ZeroMQ context
	 * @param nodes registry of nodes
	 * @param capabilities capability index kept in sync by the registry
	 * @param queue offline queue
	 * @param audit trail of routed messages
	 * @param logger
	 */
	broker_connect(std::shared_ptr<const broker_config> config,
		std::shared_ptr<zmq::context_t> context,
		std::shared_ptr<connection_registry> nodes,
		std::shared_ptr<capability_index> capabilities,
		std::shared_ptr<offline_queue> queue,
		std::shared_ptr<audit_log> audit,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Bind to sockets and start receiving and routing frames.
	 * Blocks execution until @ref stop is called.
	 */
	void start_brokering();

	/**
	 * Make @ref start_brokering return. Safe to call from a signal handler.
	 */
	void stop();
};


#endif // NODEHUB_BROKER_BROKER_CONNECT_H
