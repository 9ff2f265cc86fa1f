#ifndef NODEHUB_BROKER_NODE_H
#define NODEHUB_BROKER_NODE_H

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>


/**
 * Type, name and capabilities a node announces when it registers.
 */
struct registration_info {
	/** Kind of the node, "unknown" if not given */
	std::string type = "unknown";
	/** Human readable name, generated from the node id if empty */
	std::string name;
	std::set<std::string> capabilities;

	/**
	 * Read the registration payload. Every field is optional.
	 * @param payload JSON object {type, name, capabilities[]}
	 * @throws protocol_error if the payload is not an object or a field has a wrong type
	 */
	static registration_info from_json(const nlohmann::json &payload);

	/**
	 * Read a capability list, either a bare array or an object with a "capabilities" array.
	 * @throws protocol_error on anything else or when an item is not a string
	 */
	static std::set<std::string> parse_capabilities(const nlohmann::json &payload);
};


/**
 * A registered participant of the network, identified by its connection.
 * Instances are owned by @ref connection_registry, which performs all modifications.
 */
class node
{
public:
	/** Printable id of the connection (hex of the routing id) */
	const std::string id;
	/** Routing id used to address the connection */
	const std::string identity;

	std::string type;
	std::string name;
	std::set<std::string> capabilities;

	std::chrono::system_clock::time_point connected_at;
	std::chrono::system_clock::time_point last_seen;

	/** Remaining ping intervals before the node is considered gone */
	std::size_t liveness;

	/**
	 * @param identity routing id of the connection
	 * @param info what the node announced
	 * @param liveness initial liveness
	 */
	node(const std::string &identity, const registration_info &info, std::size_t liveness = 1);

	bool has_capability(const std::string &capability) const;

	/**
	 * Snapshot {id, type, name, capabilities, connectedAt, lastSeen} sent in presence events.
	 */
	nlohmann::json to_json() const;

	/**
	 * Get description of the node, used mainly in logs.
	 * @return name and id of the node
	 */
	std::string get_description() const;

	/**
	 * Name given to nodes which did not announce one: "node-" and first 8 characters of the id.
	 */
	static std::string default_name(const std::string &id);
};

typedef std::shared_ptr<node> node_ptr;

#endif // NODEHUB_BROKER_NODE_H
