#ifndef NODEHUB_BROKER_OFFLINE_QUEUE_H
#define NODEHUB_BROKER_OFFLINE_QUEUE_H

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "../helpers/logger.h"
#include "../message.h"
#include "../store/store_interface.h"


/**
 * Per node FIFO of messages addressed to nodes which are not connected.
 * The in-memory queues are authoritative, every change is written through to the store so that queues
 * survive a restart. Store failures are logged only.
 */
class offline_queue
{
public:
	/** Store keys of the queues are this prefix followed by the node id */
	static const std::string KEY_PREFIX;

	/**
	 * @param store backend
	 * @param logger optional logger
	 */
	explicit offline_queue(std::shared_ptr<store_interface> store, std::shared_ptr<spdlog::logger> logger = nullptr);

	virtual ~offline_queue() = default;

	/**
	 * Append a message to the end of the queue of a node.
	 */
	virtual void enqueue(const std::string &node_id, message_ptr msg);

	/**
	 * Queued messages of a node in FIFO order, the queue is not modified.
	 */
	virtual std::vector<message_ptr> peek(const std::string &node_id) const;

	/**
	 * Take all queued messages of a node in FIFO order and clear the queue.
	 */
	virtual std::vector<message_ptr> drain(const std::string &node_id);

	/**
	 * Throw away queued messages of a node.
	 * @return number of discarded messages
	 */
	virtual std::size_t purge(const std::string &node_id);

	/**
	 * Number of messages queued for all nodes.
	 */
	virtual std::size_t get_queued_count() const;

	/**
	 * Number of messages queued for one node.
	 */
	virtual std::size_t get_queued_count(const std::string &node_id) const;

	/**
	 * Reload queues persisted by a previous run of the broker.
	 * @return number of restored messages
	 */
	std::size_t restore();

private:
	void clear_stored(const std::string &node_id);

	std::shared_ptr<store_interface> store_;
	std::shared_ptr<spdlog::logger> logger_;

	mutable std::mutex mutex_;
	std::map<std::string, std::deque<message_ptr>> queues_;
};

#endif // NODEHUB_BROKER_OFFLINE_QUEUE_H
