#ifndef NODEHUB_BROKER_CAPABILITY_INDEX_H
#define NODEHUB_BROKER_CAPABILITY_INDEX_H

#include <map>
#include <mutex>
#include <set>
#include <string>


/**
 * Reverse index from capability names to ids of nodes advertising them.
 * All operations are thread safe and readers always get a consistent snapshot.
 */
class capability_index
{
public:
	typedef std::set<std::string> id_set;

	capability_index() = default;
	virtual ~capability_index() = default;

	/**
	 * Replace all capabilities of a node.
	 * @param node_id id of the node
	 * @param capabilities new capability set, empty set removes the node
	 */
	virtual void advertise(const std::string &node_id, const std::set<std::string> &capabilities);

	/**
	 * Ids of nodes advertising a capability.
	 * @return point-in-time snapshot, empty for unknown capabilities
	 */
	virtual id_set nodes_with(const std::string &capability) const;

	/**
	 * Forget the node entirely. Removing an unknown node does nothing.
	 */
	virtual void remove(const std::string &node_id);

	/**
	 * Capabilities currently advertised by a node.
	 */
	virtual std::set<std::string> capabilities_of(const std::string &node_id) const;

	/**
	 * Snapshot of the whole index, capability to node ids.
	 */
	virtual std::map<std::string, id_set> get_capabilities() const;

private:
	/** Caller must hold the lock */
	void remove_locked(const std::string &node_id);

	mutable std::mutex mutex_;
	std::map<std::string, id_set> nodes_by_capability_;
	std::map<std::string, std::set<std::string>> capabilities_by_node_;
};

#endif // NODEHUB_BROKER_CAPABILITY_INDEX_H
