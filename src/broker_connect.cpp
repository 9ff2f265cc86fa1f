#include "broker_connect.h"
#include "handlers/broker_handler.h"
#include "handlers/event_notifier_handler.h"
#include "handlers/management_handler.h"
#include "handlers/task_timer_handler.h"
#include "helpers/logger.h"
#include "reactor/router_socket_wrapper.h"

const std::string broker_connect::KEY_NODES = "nodes";
const std::string broker_connect::KEY_MANAGEMENT = "management";
const std::string broker_connect::KEY_EVENT_NOTIFIER = "event_notifier";
const std::string broker_connect::KEY_TASK_TIMER = "task_timer";
const std::string broker_connect::KEY_TASK_EXPIRED = "task_expired";
const std::string broker_connect::KEY_TIMER = reactor::KEY_TIMER;

broker_connect::broker_connect(std::shared_ptr<const broker_config> config,
	std::shared_ptr<zmq::context_t> context,
	std::shared_ptr<connection_registry> nodes,
	std::shared_ptr<capability_index> capabilities,
	std::shared_ptr<offline_queue> queue,
	std::shared_ptr<audit_log> audit,
	std::shared_ptr<spdlog::logger> logger)
	: config_(config), logger_(logger), nodes_(nodes), reactor_(context)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	router_ = std::make_shared<message_router>(nodes_, capabilities, queue, audit, logger_);
	dispatcher_ = std::make_shared<task_dispatcher>(nodes_,
		capabilities,
		std::make_shared<random_node_selector>(),
		config_->get_default_task_timeout(),
		logger_);

	auto nodes_endpoint = "tcp://" + config_->get_node_address() + ":" + std::to_string(config_->get_node_port());
	logger_->debug("Binding nodes to {}", nodes_endpoint);

	auto management_endpoint =
		"tcp://" + config_->get_management_address() + ":" + std::to_string(config_->get_management_port());
	logger_->debug("Binding management to {}", management_endpoint);

	reactor_.add_socket(KEY_NODES, std::make_shared<router_socket_wrapper>(context, nodes_endpoint, true));
	reactor_.add_socket(KEY_MANAGEMENT, std::make_shared<router_socket_wrapper>(context, management_endpoint, true));

	reactor_.add_handler({KEY_NODES, KEY_TIMER, KEY_TASK_EXPIRED},
		std::make_shared<broker_handler>(config_, nodes_, router_, dispatcher_, logger_));
	reactor_.add_handler({KEY_MANAGEMENT},
		std::make_shared<management_handler>(nodes_, capabilities, router_, dispatcher_, queue, audit, logger_));
	reactor_.add_async_handler({KEY_TASK_TIMER, KEY_TIMER}, std::make_shared<task_timer_handler>(logger_));

	if (config_->get_notifier_config().enabled()) {
		logger_->debug("Events are posted to {}", config_->get_notifier_config().address);
		reactor_.add_async_handler(
			{KEY_EVENT_NOTIFIER}, std::make_shared<event_notifier_handler>(config_->get_notifier_config(), logger_));
	}
}

void broker_connect::start_brokering()
{
	reactor_.start_loop();
	logger_->info("The main loop terminated");
}

void broker_connect::stop()
{
	reactor_.terminate();
}
