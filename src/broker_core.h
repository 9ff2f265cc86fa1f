#ifndef NODEHUB_BROKER_CORE_H
#define NODEHUB_BROKER_CORE_H

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <zmq.hpp>

#include "broker_connect.h"
#include "capability_index.h"
#include "config/broker_config.h"
#include "connection_registry.h"
#include "queuing/offline_queue.h"
#include "store/audit_log.h"
#include "store/store_interface.h"


/**
 * Main class of whole program.
 * It handles creation and destruction of all used parts. And of course running them.
 */
class broker_core
{
public:
	broker_core() = delete;
	broker_core(const broker_core &source) = delete;
	broker_core &operator=(const broker_core &source) = delete;
	broker_core(broker_core &&source) = delete;
	broker_core &operator=(broker_core &&source) = delete;

	/**
	 * Parses command line parameters, loads configuration and initializes all components.
	 * @param args Command line parameters.
	 */
	explicit broker_core(std::vector<std::string> args);

	/**
	 * Destructor. Cleans up libcurl and flushes the log.
	 */
	~broker_core();

	/**
	 * Start the broker service. Returns after SIGINT or SIGTERM.
	 */
	void run();

private:
	/**
	 * Setup all things around spdlog logger, creates log path/file if not existing.
	 */
	void log_init();

	/**
	 * Create the store, registries and queues, restore persisted queues.
	 */
	void state_init();

	/**
	 * Construct and setup broker connection.
	 * libCURL (@a curl_init) and the state (@a state_init) should be initialized before this.
	 */
	void broker_init();

	/**
	 * Globally initializes libCURL library.
	 */
	void curl_init();

	/**
	 * libCURL cleanup.
	 */
	void curl_fini();

	/**
	 * Exit whole application with return code 1.
	 * @param msg String which is copied to stderr and logger if initialized (critical level).
	 */
	[[noreturn]] void force_exit(const std::string &msg = "");

	/**
	 * Parse command line arguments given in constructor.
	 */
	void parse_params();

	/**
	 * Load broker configuration from config file at default location
	 * or from file given in cmd parameters.
	 */
	void load_config();

	/** Command line parameters. */
	std::vector<std::string> args_;

	/** Filename where broker configuration is loaded from. */
	std::string config_filename_;

	std::shared_ptr<broker_config> config_;

	std::shared_ptr<spdlog::logger> logger_;

	/** Backend of offline queues and the audit trail. */
	std::shared_ptr<store_interface> store_;

	std::shared_ptr<capability_index> capabilities_;

	std::shared_ptr<connection_registry> nodes_;

	std::shared_ptr<offline_queue> queue_;

	std::shared_ptr<audit_log> audit_;

	std::shared_ptr<zmq::context_t> context_;

	/** Main broker class which handles incoming and outgoing connections. */
	std::shared_ptr<broker_connect> broker_;

	bool curl_initialized_ = false;
};

#endif // NODEHUB_BROKER_CORE_H
