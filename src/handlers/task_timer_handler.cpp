#include "task_timer_handler.h"
#include "../broker_connect.h"
#include "../helpers/logger.h"

#include <stdexcept>
#include <vector>


const std::string task_timer_handler::CMD_ARM = "arm";
const std::string task_timer_handler::CMD_CANCEL = "cancel";

task_timer_handler::task_timer_handler(std::shared_ptr<spdlog::logger> logger, clock_fn clock)
	: logger_(logger), clock_(clock)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	if (clock_ == nullptr) {
		clock_ = []() { return std::chrono::steady_clock::now(); };
	}
}

void task_timer_handler::on_request(const message_container &message, const response_cb &respond)
{
	if (message.key == broker_connect::KEY_TIMER) {
		process_timer(respond);
	} else if (message.key == broker_connect::KEY_TASK_TIMER) {
		process_control(message);
	}
}

void task_timer_handler::process_control(const message_container &message)
{
	const std::string &command = message.get_frame(0);
	const std::string &task_id = message.get_frame(1);

	if (command == CMD_ARM && message.data.size() >= 3) {
		std::chrono::milliseconds timeout;
		try {
			timeout = std::chrono::milliseconds(std::stoll(message.data[2]));
		} catch (std::logic_error &) {
			logger_->error("Timer of task {} not armed, invalid timeout '{}'", task_id, message.data[2]);
			return;
		}

		timers_[task_id] = clock_() + timeout;
		logger_->debug("Timer of task {} armed for {} ms", task_id, static_cast<long long>(timeout.count()));
	} else if (command == CMD_CANCEL) {
		if (timers_.erase(task_id) > 0) {
			logger_->debug("Timer of task {} cancelled", task_id);
		}
	} else {
		logger_->warn("Malformed task timer request '{}' ignored", command);
	}
}

void task_timer_handler::process_timer(const response_cb &respond)
{
	if (timers_.empty()) {
		return;
	}

	auto now = clock_();
	std::vector<std::string> expired;
	for (auto &timer : timers_) {
		if (timer.second <= now) {
			expired.push_back(timer.first);
		}
	}

	for (auto &task_id : expired) {
		timers_.erase(task_id);
		respond(message_container(broker_connect::KEY_TASK_EXPIRED, "", {task_id}));
	}
}

std::size_t task_timer_handler::get_armed_count() const
{
	return timers_.size();
}

std::chrono::milliseconds task_timer_handler::get_remaining(const std::string &task_id) const
{
	auto it = timers_.find(task_id);
	if (it == timers_.end()) {
		return std::chrono::milliseconds(-1);
	}

	auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(it->second - clock_());
	return remaining.count() > 0 ? remaining : std::chrono::milliseconds(0);
}
