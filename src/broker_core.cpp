#include "broker_core.h"
#include "helpers/logger.h"
#include "store/file_store.h"
#include "store/memory_store.h"

#include <atomic>
#include <csignal>
#include <curl/curl.h>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <yaml-cpp/yaml.h>

#define BOOST_FILESYSTEM_NO_DEPRECATED
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
namespace fs = boost::filesystem;

namespace
{
	/** Broker stopped by signal handlers */
	std::atomic<broker_connect *> running_broker(nullptr);

	void stop_running_broker(int)
	{
		broker_connect *broker = running_broker.load();
		if (broker != nullptr) {
			broker->stop();
		}
	}
} // namespace

broker_core::broker_core(std::vector<std::string> args)
	: args_(args), config_filename_("config.yml"), logger_(nullptr), broker_(nullptr)
{
	// parse cmd parameters
	parse_params();
	// load configuration from yaml file
	load_config();
	// initialize logger
	log_init();
	// initialize curl
	curl_init();
	// restore persisted state
	state_init();
	// construct and setup broker connection
	broker_init();
}

broker_core::~broker_core()
{
	curl_fini();
	spdlog::shutdown();
}

void broker_core::run()
{
	logger_->info("Broker will now start brokering.");

	running_broker.store(broker_.get());
	std::signal(SIGINT, stop_running_broker);
	std::signal(SIGTERM, stop_running_broker);

	broker_->start_brokering();

	running_broker.store(nullptr);
	logger_->info("Broker will now end.");
}

void broker_core::parse_params()
{
	using namespace boost::program_options;

	options_description desc("Allowed options for nodehub-broker");
	desc.add_options()("help,h", "Writes this help message to stderr")(
		"config,c", value<std::string>(), "Set configuration file of this program (default config.yml)");

	variables_map vm;
	try {
		store(command_line_parser(args_).options(desc).run(), vm);
		notify(vm);
	} catch (error &e) {
		force_exit("Error in loading a parameter: " + std::string(e.what()));
	}

	if (vm.count("help")) {
		std::cerr << desc << std::endl;
		force_exit();
	}

	if (vm.count("config")) {
		config_filename_ = vm["config"].as<std::string>();
	}
}

void broker_core::load_config()
{
	try {
		YAML::Node config_yaml = YAML::LoadFile(config_filename_);
		config_ = std::make_shared<broker_config>(config_yaml);
	} catch (YAML::Exception &e) {
		force_exit("Error loading config file: " + std::string(e.what()));
	} catch (config_error &e) {
		force_exit("Error loading config file: " + std::string(e.what()));
	}
}

void broker_core::force_exit(const std::string &msg)
{
	if (!msg.empty()) {
		if (logger_ != nullptr) {
			logger_->critical(msg);
			logger_->flush();
		}
		std::cerr << msg << std::endl;
	}

	exit(1);
}

void broker_core::log_init()
{
	auto log_conf = config_->get_log_config();

	// Try to create target directory for logs
	auto path = fs::path(log_conf.log_path);
	try {
		if (!fs::is_directory(path)) {
			fs::create_directories(path);
		}
	} catch (fs::filesystem_error &e) {
		force_exit("Logger: " + std::string(e.what()));
	}

	try {
		auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
			(path / (log_conf.log_basename + "." + log_conf.log_suffix)).string(),
			log_conf.log_file_size,
			log_conf.log_files_count);

		// Queue size for asynchronous logging must be a power of 2
		spdlog::init_thread_pool(1 << 16, 1);
		logger_ = std::make_shared<spdlog::async_logger>(
			"logger", rotating_sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
		spdlog::register_logger(logger_);
		spdlog::flush_every(std::chrono::seconds(1));

		logger_->set_level(helpers::get_log_level(log_conf.log_level));
		logger_->flush_on(spdlog::level::err);

		if (!logger_->should_log(spdlog::level::info)) {
			logger_->critical("--- Started nodehub broker ---");
		} else {
			logger_->info("------------------------------");
			logger_->info("    Started nodehub broker");
			logger_->info("------------------------------");
		}
	} catch (spdlog::spdlog_ex &e) {
		force_exit("Logger: " + std::string(e.what()));
	}
}

void broker_core::state_init()
{
	auto store_conf = config_->get_store_config();

	try {
		if (store_conf.type == "file") {
			logger_->info("Using file store in {}", store_conf.path);
			store_ = std::make_shared<file_store>(store_conf.path);
		} else {
			logger_->info("Using in-memory store, offline queues will not survive a restart");
			store_ = std::make_shared<memory_store>();
		}
	} catch (store_error &e) {
		force_exit("Store cannot be opened: " + std::string(e.what()));
	}

	capabilities_ = std::make_shared<capability_index>();
	nodes_ = std::make_shared<connection_registry>(
		capabilities_, config_->get_registration_policy(), config_->get_max_node_liveness());
	queue_ = std::make_shared<offline_queue>(store_, logger_);
	audit_ = std::make_shared<audit_log>(store_, config_->get_max_audit_entries(), logger_);

	std::size_t restored = queue_->restore();
	if (restored > 0) {
		logger_->info("Restored {} queued messages", restored);
	}
}

void broker_core::broker_init()
{
	logger_->info("Initializing broker connection...");
	context_ = std::make_shared<zmq::context_t>(1);
	broker_ = std::make_shared<broker_connect>(config_, context_, nodes_, capabilities_, queue_, audit_, logger_);
	logger_->info("Broker connection initialized.");
}

void broker_core::curl_init()
{
	logger_->info("Initializing CURL...");
	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		force_exit("CURL cannot be initialized");
	}
	curl_initialized_ = true;
	logger_->info("CURL initialized.");
}

void broker_core::curl_fini()
{
	if (!curl_initialized_) {
		return;
	}

	logger_->info("Cleanup after CURL...");
	curl_global_cleanup();
	logger_->info("CURL cleaned.");
}
