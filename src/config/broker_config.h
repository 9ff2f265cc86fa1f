#ifndef NODEHUB_BROKER_CONFIG_H
#define NODEHUB_BROKER_CONFIG_H

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "log_config.h"
#include "notifier_config.h"
#include "registration_policy.h"
#include "store_config.h"


/**
 * An object representation of the broker's configuration.
 * Every key of the YAML document is optional, missing keys keep their defaults.
 */
class broker_config
{
public:
	/** A default constructor */
	broker_config() = default;
	/**
	 * A constructor that loads the configuration from a YAML document.
	 * @param config The input document.
	 * @throws config_error if the document or one of its values is invalid
	 */
	explicit broker_config(const YAML::Node &config);
	/**
	 * Destructor
	 */
	virtual ~broker_config() = default;
	/**
	 * Get IP address the node socket binds to.
	 * @return Address, '*' means all interfaces.
	 */
	virtual const std::string &get_node_address() const;
	/**
	 * Get the port the node socket binds to.
	 * @return Broker's port for node connections.
	 */
	virtual std::uint16_t get_node_port() const;
	/**
	 * Get IP address of the management socket.
	 * @return Broker's address for management connections.
	 */
	virtual const std::string &get_management_address() const;
	/**
	 * Get the port of the management socket.
	 * @return Broker's port for management connections.
	 */
	virtual std::uint16_t get_management_port() const;
	/**
	 * Get the maximum (i.e. initial) liveness of a node.
	 * @return Number of ping intervals a node may stay silent.
	 */
	virtual std::size_t get_max_node_liveness() const;
	/**
	 * Get the time (in milliseconds) expected to pass between frames from a node.
	 * @return Interval between two concurrent pings.
	 */
	virtual std::chrono::milliseconds get_node_ping_interval() const;
	/**
	 * Get the behaviour on repeated registration of one connection.
	 */
	virtual registration_policy get_registration_policy() const;
	/**
	 * Get the timeout of tasks which do not carry their own.
	 */
	virtual std::chrono::milliseconds get_default_task_timeout() const;
	/**
	 * Whether queued messages are pushed to a node right after it registers.
	 */
	virtual bool get_deliver_queued_on_register() const;
	/**
	 * Get the maximal number of entries kept in the audit trail.
	 */
	virtual std::size_t get_max_audit_entries() const;
	/**
	 * Get wrapper for store configuration.
	 */
	virtual const store_config &get_store_config() const;
	/**
	 * Get wrapper for logger configuration.
	 * @return Logging config as @ref log_config structure.
	 */
	virtual const log_config &get_log_config() const;
	/**
	 * Get wrapper for webhook notifier configuration.
	 * @return Webhook connection information as @ref notifier_config structure.
	 */
	virtual const notifier_config &get_notifier_config() const;

private:
	/** Node socket address */
	std::string node_address_ = "*"; // '*' is any address
	/** Node socket port */
	std::uint16_t node_port_ = 9658;
	/** Management socket address */
	std::string management_address_ = "127.0.0.1";
	/** Management socket port */
	std::uint16_t management_port_ = 9659;
	/**
	 * Maximum (initial) liveness of a node
	 * (the amount of pings the node can miss before it's considered gone)
	 */
	std::size_t max_node_liveness_ = 4;
	/** Time (in milliseconds) expected to pass between pings from the node */
	std::chrono::milliseconds node_ping_interval_ = std::chrono::milliseconds(5000);
	/** Behaviour on repeated registration */
	registration_policy registration_policy_ = registration_policy::replace;
	/** Default task timeout */
	std::chrono::milliseconds default_task_timeout_ = std::chrono::milliseconds(30000);
	/** Push queued messages on registration */
	bool deliver_queued_on_register_ = true;
	/** Bound of the audit trail */
	std::size_t max_audit_entries_ = 1000;
	/** Configuration of the store */
	store_config store_config_;
	/** Configuration of logger */
	log_config log_config_;
	/** Configuration of webhook notifier */
	notifier_config notifier_config_;
};


/**
 * Broker configuration exception.
 */
class config_error : public std::runtime_error
{
public:
	/**
	 * Construction with message returned with @a what method.
	 * @param msg description of exception circumstances
	 */
	explicit config_error(const std::string &msg) : std::runtime_error(msg)
	{
	}
};

#endif // NODEHUB_BROKER_CONFIG_H
