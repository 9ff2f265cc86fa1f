#include "broker_config.h"

#define BOOST_FILESYSTEM_NO_DEPRECATED
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace
{
	/**
	 * Assign value of the scalar under given key of a map node, keep the target untouched otherwise.
	 */
	template <typename T> void load_scalar(const YAML::Node &section, const char *key, T &target)
	{
		if (section[key] && section[key].IsScalar()) {
			target = section[key].template as<T>();
		} // no throw... can be omitted
	}

	void load_milliseconds(const YAML::Node &section, const char *key, std::chrono::milliseconds &target)
	{
		if (section[key] && section[key].IsScalar()) {
			target = std::chrono::milliseconds(section[key].as<std::size_t>());
		}
	}

	bool is_section(const YAML::Node &config, const char *name)
	{
		return config[name] && config[name].IsMap();
	}
} // namespace

broker_config::broker_config(const YAML::Node &config)
{
	try {
		if (!config.IsMap()) {
			throw config_error("The configuration is not a YAML map");
		}

		// node socket and liveness
		if (is_section(config, "nodes")) {
			const YAML::Node &nodes = config["nodes"];
			load_scalar(nodes, "address", node_address_);
			load_scalar(nodes, "port", node_port_);
			load_scalar(nodes, "max_liveness", max_node_liveness_);
			load_milliseconds(nodes, "ping_interval", node_ping_interval_);

			std::string policy;
			load_scalar(nodes, "registration_policy", policy);
			if (policy == "reject") {
				registration_policy_ = registration_policy::reject;
			} else if (policy == "replace") {
				registration_policy_ = registration_policy::replace;
			} else if (!policy.empty()) {
				throw config_error("Unknown registration policy '" + policy + "'");
			}
		}

		if (max_node_liveness_ == 0) {
			throw config_error("Node liveness has to be positive");
		}
		if (node_ping_interval_.count() == 0) {
			throw config_error("Node ping interval has to be positive");
		}

		// management socket
		if (is_section(config, "management")) {
			load_scalar(config["management"], "address", management_address_);
			load_scalar(config["management"], "port", management_port_);
		}

		if (is_section(config, "tasks")) {
			load_milliseconds(config["tasks"], "default_timeout", default_task_timeout_);
		}

		if (is_section(config, "queue")) {
			load_scalar(config["queue"], "deliver_on_register", deliver_queued_on_register_);
		}

		if (is_section(config, "audit")) {
			load_scalar(config["audit"], "max_entries", max_audit_entries_);
		}

		if (is_section(config, "store")) {
			load_scalar(config["store"], "type", store_config_.type);
			load_scalar(config["store"], "path", store_config_.path);
		}
		if (store_config_.type != "memory" && store_config_.type != "file") {
			throw config_error("Unknown store type '" + store_config_.type + "'");
		}

		// webhook notifier
		if (is_section(config, "notifier")) {
			const YAML::Node &notifier = config["notifier"];
			load_scalar(notifier, "address", notifier_config_.address);
			load_scalar(notifier, "port", notifier_config_.port);
			load_scalar(notifier, "username", notifier_config_.username);
			load_scalar(notifier, "password", notifier_config_.password);
		}

		// load logger
		if (is_section(config, "logger")) {
			const YAML::Node &logger = config["logger"];
			if (logger["file"] && logger["file"].IsScalar()) {
				fs::path tmp = logger["file"].as<std::string>();
				log_config_.log_basename = tmp.filename().string();
				log_config_.log_path = tmp.parent_path().string();
			} // no throw... can be omitted
			load_scalar(logger, "level", log_config_.log_level);
			load_scalar(logger, "max-size", log_config_.log_file_size);
			load_scalar(logger, "rotations", log_config_.log_files_count);
		}
	} catch (YAML::Exception &ex) {
		throw config_error("Broker configuration was not loaded: " + std::string(ex.what()));
	}
}

const std::string &broker_config::get_node_address() const
{
	return node_address_;
}

std::uint16_t broker_config::get_node_port() const
{
	return node_port_;
}

const std::string &broker_config::get_management_address() const
{
	return management_address_;
}

std::uint16_t broker_config::get_management_port() const
{
	return management_port_;
}

std::size_t broker_config::get_max_node_liveness() const
{
	return max_node_liveness_;
}

std::chrono::milliseconds broker_config::get_node_ping_interval() const
{
	return node_ping_interval_;
}

registration_policy broker_config::get_registration_policy() const
{
	return registration_policy_;
}

std::chrono::milliseconds broker_config::get_default_task_timeout() const
{
	return default_task_timeout_;
}

bool broker_config::get_deliver_queued_on_register() const
{
	return deliver_queued_on_register_;
}

std::size_t broker_config::get_max_audit_entries() const
{
	return max_audit_entries_;
}

const store_config &broker_config::get_store_config() const
{
	return store_config_;
}

const log_config &broker_config::get_log_config() const
{
	return log_config_;
}

const notifier_config &broker_config::get_notifier_config() const
{
	return notifier_config_;
}
