#ifndef NODEHUB_BROKER_REACTOR_EVENT_NOTIFIER_H
#define NODEHUB_BROKER_REACTOR_EVENT_NOTIFIER_H

#include "../reactor/handler_interface.h"
#include "event_notifier.h"

/**
 * An event notifier that forwards events to a handler registered in our ZeroMQ reactor.
 * The HTTP requests are then made asynchronously, routing never waits for them.
 *
 * Events are packed as key/value frame pairs, "type" and "id" become parts of the url.
 */
class reactor_event_notifier : public event_notifier_interface
{
private:
	/** A callback for sending messages through the reactor */
	handler_interface::response_cb callback_;

	/** The name under which the event notifier handler is registered in the reactor */
	const std::string key_;

public:
	/**
	 * @param callback response callback of the reactor event handler which uses the notifier
	 * @param key Reactor event key for messages sent by the notifier
	 */
	reactor_event_notifier(handler_interface::response_cb callback, const std::string &key);

	~reactor_event_notifier() override = default;

	void error(const std::string &desc) override;
	void node_online(const std::string &node_id, const std::string &name) override;
	void node_offline(const std::string &node_id, const std::string &name) override;
	void task_status(const std::string &task_id, const std::string &status, const std::string &desc = "") override;
};

#endif // NODEHUB_BROKER_REACTOR_EVENT_NOTIFIER_H
