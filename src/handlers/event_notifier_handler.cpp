#include "event_notifier_handler.h"
#include "../helpers/logger.h"

#include <thread>


const std::string event_notifier_handler::TYPE_ERROR = "error";
const std::string event_notifier_handler::TYPE_NODE_STATUS = "node-status";
const std::string event_notifier_handler::TYPE_TASK_STATUS = "task-status";

event_notifier_handler::event_notifier_handler(const notifier_config &config,
	std::shared_ptr<spdlog::logger> logger,
	std::size_t attempts,
	std::chrono::milliseconds initial_delay)
	: config_(config), logger_(logger), attempts_(attempts), initial_delay_(initial_delay)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

event_notifier_handler::request event_notifier_handler::build_request(const message_container &message) const
{
	std::string type;
	std::string id;
	request result;

	for (std::size_t i = 0; i + 1 < message.data.size(); i += 2) {
		const std::string &key = message.data[i];
		const std::string &value = message.data[i + 1];

		if (key == "type") {
			type = value;
		} else if (key == "id") {
			id = value;
		} else {
			result.params[key] = value;
		}
	}

	result.url = config_.address;
	if (!type.empty()) {
		result.url += "/" + type;
	}
	if (!id.empty()) {
		result.url += "/" + id;
	}

	return result;
}

void event_notifier_handler::on_request(const message_container &message, const handler_interface::response_cb &)
{
	if (!config_.enabled()) {
		return;
	}

	request req = build_request(message);
	auto delay = initial_delay_;

	for (std::size_t attempt = 1; attempt <= attempts_; ++attempt) {
		try {
			helpers::curl_post(req.url, config_.port, req.params, config_.username, config_.password);
			logger_->debug("Event delivered to {}", req.url);
			return;
		} catch (helpers::curl_exception &exception) {
			logger_->warn("Event notification attempt {}/{} failed: {}", attempt, attempts_, exception.what());
		}

		if (attempt < attempts_) {
			std::this_thread::sleep_for(delay);
			delay *= 2;
		}
	}

	logger_->error("Event for {} was dropped after {} attempts", req.url, attempts_);
}
