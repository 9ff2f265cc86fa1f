#ifndef NODEHUB_BROKER_MESSAGE_H
#define NODEHUB_BROKER_MESSAGE_H

#include <memory>
#include <nlohmann/json.hpp>
#include <string>


/**
 * Routed message envelope. Never modified after creation, shared through @ref message_ptr.
 */
class message
{
public:
	const std::string id;
	/** Id of the sending node */
	const std::string from;
	/** Node id, broadcast token, "type:<capability>" or empty */
	const std::string to;
	const std::string type;
	/** Opaque, never interpreted by the broker */
	const nlohmann::json payload;
	const std::string timestamp;

	message(const std::string &id,
		const std::string &from,
		const std::string &to,
		const std::string &type,
		const nlohmann::json &payload,
		const std::string &timestamp);

	/**
	 * Envelope {id, from, to?, type, payload, timestamp} as delivered to nodes and persisted.
	 */
	nlohmann::json to_json() const;

	/**
	 * Restore a persisted envelope.
	 * @throws protocol_error when id or from are missing
	 */
	static message from_json(const nlohmann::json &source);
};

typedef std::shared_ptr<const message> message_ptr;


/**
 * Message as sent by a node, before the broker stamps it.
 */
struct message_request {
	std::string to;
	std::string type;
	nlohmann::json payload;
	/** Id chosen by the sender, generated if empty */
	std::string message_id;

	/**
	 * Read the payload of a message frame {to?, type?, payload?, messageId?}.
	 * @throws protocol_error if it is not an object or a field has a wrong type
	 */
	static message_request from_json(const nlohmann::json &source);

	/**
	 * Whether the message goes to every connected node.
	 */
	bool is_broadcast() const;

	/**
	 * Whether the message addresses a capability, the capability is returned by @ref get_capability.
	 */
	bool is_capability_class() const;

	std::string get_capability() const;
};

#endif // NODEHUB_BROKER_MESSAGE_H
