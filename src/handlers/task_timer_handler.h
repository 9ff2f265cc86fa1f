#ifndef NODEHUB_BROKER_TASK_TIMER_HANDLER_H
#define NODEHUB_BROKER_TASK_TIMER_HANDLER_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <spdlog/logger.h>

#include "../reactor/handler_interface.h"

/**
 * Measures timeouts of dispatched tasks on its own asynchronous reactor lane.
 *
 * Timers are armed by ["arm", task id, milliseconds] and cancelled by ["cancel", task id] messages. An armed timer
 * holds an absolute deadline on the steady clock, reactor timer ticks only wake the lane up to compare deadlines
 * with the current time. When a timer runs out, [task id] is sent under the task expiration key back to the
 * reactor, where the dispatcher decides whether the task still waits for an outcome.
 */
class task_timer_handler : public handler_interface
{
public:
	static const std::string CMD_ARM;
	static const std::string CMD_CANCEL;

	/** Source of the current time */
	typedef std::function<std::chrono::steady_clock::time_point()> clock_fn;

	/**
	 * @param logger optional logger
	 * @param clock current time, steady clock if not given
	 */
	explicit task_timer_handler(std::shared_ptr<spdlog::logger> logger = nullptr, clock_fn clock = nullptr);

	~task_timer_handler() override = default;

	void on_request(const message_container &message, const response_cb &respond) override;

	/** Number of running timers */
	std::size_t get_armed_count() const;

	/**
	 * Remaining time of a timer, zero once the deadline passed and negative if there is no such timer.
	 */
	std::chrono::milliseconds get_remaining(const std::string &task_id) const;

private:
	void process_control(const message_container &message);
	void process_timer(const response_cb &respond);

	std::shared_ptr<spdlog::logger> logger_;
	clock_fn clock_;

	/** Deadlines of armed timers by task id */
	std::map<std::string, std::chrono::steady_clock::time_point> timers_;
};

#endif // NODEHUB_BROKER_TASK_TIMER_HANDLER_H
