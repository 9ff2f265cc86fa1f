#ifndef NODEHUB_BROKER_EVENT_NOTIFIER_HANDLER_H
#define NODEHUB_BROKER_EVENT_NOTIFIER_HANDLER_H

#include <chrono>
#include <memory>
#include <spdlog/logger.h>

#include "../config/notifier_config.h"
#include "../helpers/curl.h"
#include "../reactor/handler_interface.h"

/**
 * Receives events from @ref reactor_event_notifier and POSTs them to the configured webhook.
 * Meant to run as an asynchronous reactor handler, failed requests are retried with growing delays.
 */
class event_notifier_handler : public handler_interface
{
public:
	/** Webhook endpoint receiving error messages */
	static const std::string TYPE_ERROR;
	/** Webhook endpoint receiving node presence */
	static const std::string TYPE_NODE_STATUS;
	/** Webhook endpoint receiving task lifecycle */
	static const std::string TYPE_TASK_STATUS;

	/**
	 * HTTP request derived from one event.
	 */
	struct request {
		std::string url;
		helpers::curl_params params;
	};

	/**
	 * @param config url and credentials of the webhook
	 * @param logger logger used when a HTTP request fails
	 * @param attempts number of tries of every request
	 * @param initial_delay pause after the first failure, doubled after every next one
	 */
	event_notifier_handler(const notifier_config &config,
		std::shared_ptr<spdlog::logger> logger,
		std::size_t attempts = 4,
		std::chrono::milliseconds initial_delay = std::chrono::seconds(1));

	~event_notifier_handler() override = default;

	void on_request(const message_container &message, const response_cb &respond) override;

	/**
	 * Translate key/value frames of an event to url "<address>/<type>/<id>" and form parameters.
	 * A trailing key without value is ignored.
	 */
	request build_request(const message_container &message) const;

private:
	const notifier_config config_;
	std::shared_ptr<spdlog::logger> logger_;
	std::size_t attempts_;
	std::chrono::milliseconds initial_delay_;
};

#endif // NODEHUB_BROKER_EVENT_NOTIFIER_HANDLER_H
