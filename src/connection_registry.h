#ifndef NODEHUB_BROKER_CONNECTION_REGISTRY_H
#define NODEHUB_BROKER_CONNECTION_REGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "capability_index.h"
#include "config/registration_policy.h"
#include "node.h"


/**
 * Outcome of a registration.
 */
struct registration_result {
	/** The registered node, or the untouched existing one when rejected */
	node_ptr registered;
	/** False only for a repeated registration under the reject policy */
	bool accepted;
	/** True if an existing registration of the connection was overwritten */
	bool replaced;
};


/**
 * Tracks registered nodes and keeps the capability index in sync with them.
 * Every node mutation and the matching index update happen under one lock.
 */
class connection_registry
{
public:
	/**
	 * @param index capability index updated together with the nodes
	 * @param policy behaviour on repeated registration of a connection
	 * @param max_liveness liveness given to nodes on registration and on every touch
	 */
	connection_registry(std::shared_ptr<capability_index> index,
		registration_policy policy = registration_policy::replace,
		std::size_t max_liveness = 1);

	virtual ~connection_registry() = default;

	/**
	 * Register the connection as a node, or update its registration.
	 * @param identity routing id of the connection
	 * @param info announced type, name and capabilities
	 */
	virtual registration_result register_node(const std::string &identity, const registration_info &info);

	/**
	 * Replace capabilities of a registered node.
	 * @return false (and nothing changes) if the node is not registered
	 */
	virtual bool update_capabilities(const std::string &node_id, const std::set<std::string> &capabilities);

	/**
	 * Find a node by its id.
	 * @return the node or nullptr
	 */
	virtual node_ptr lookup(const std::string &node_id) const;

	/**
	 * Find a node by the routing id of its connection.
	 * @return the node or nullptr
	 */
	virtual node_ptr find_by_identity(const std::string &identity) const;

	/**
	 * Remove the node and its capabilities.
	 * @return the removed node, nullptr if it was not registered
	 */
	virtual node_ptr evict(const std::string &node_id);

	/**
	 * Record activity of a node (resets its liveness).
	 * @return false if the node is not registered
	 */
	virtual bool touch(const std::string &node_id);

	/**
	 * Decrease liveness of a node by one.
	 * @return remaining liveness, zero also for unknown nodes
	 */
	virtual std::size_t decrease_liveness(const std::string &node_id);

	/**
	 * Snapshot of registered nodes ordered by id.
	 */
	virtual std::vector<node_ptr> get_nodes() const;

	virtual std::size_t size() const;

	bool is_connected(const std::string &node_id) const
	{
		return lookup(node_id) != nullptr;
	}

private:
	std::shared_ptr<capability_index> index_;
	registration_policy policy_;
	std::size_t max_liveness_;

	mutable std::mutex mutex_;
	std::map<std::string, node_ptr> nodes_;
};

#endif // NODEHUB_BROKER_CONNECTION_REGISTRY_H
