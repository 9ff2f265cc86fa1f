#ifndef NODEHUB_BROKER_STORE_INTERFACE_H
#define NODEHUB_BROKER_STORE_INTERFACE_H

#include <stdexcept>
#include <string>
#include <vector>


/**
 * Durable key to list-of-values store backing the offline queues and the audit trail.
 * Values are opaque strings (serialized JSON), lists keep insertion order.
 * Implementations are thread safe.
 */
class store_interface
{
public:
	virtual ~store_interface() = default;

	/**
	 * Append a value to the end of the list under the key.
	 * @throws store_error
	 */
	virtual void append(const std::string &key, const std::string &value) = 0;

	/**
	 * Read the whole list, optionally clearing it in the same step.
	 * @param key list to read
	 * @param clear remove the list after reading
	 * @return values in insertion order, empty for unknown keys
	 * @throws store_error
	 */
	virtual std::vector<std::string> read_all(const std::string &key, bool clear = false) = 0;

	/**
	 * Keep only the newest values of a list.
	 * @param key list to trim
	 * @param keep_last number of values kept at the end of the list
	 * @throws store_error
	 */
	virtual void trim(const std::string &key, std::size_t keep_last) = 0;

	/**
	 * Keys of all non-empty lists starting with the prefix.
	 * @throws store_error
	 */
	virtual std::vector<std::string> keys(const std::string &prefix) = 0;
};


/**
 * Failure of the storage backend.
 */
class store_error : public std::runtime_error
{
public:
	explicit store_error(const std::string &msg) : std::runtime_error(msg)
	{
	}
};

#endif // NODEHUB_BROKER_STORE_INTERFACE_H
