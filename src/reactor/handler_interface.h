#ifndef NODEHUB_BROKER_HANDLER_INTERFACE_H
#define NODEHUB_BROKER_HANDLER_INTERFACE_H

#include <functional>

#include "message_container.h"

/**
 * An interface for reactor event handlers.
 * Handlers never talk to sockets, they answer through the response callback and the reactor routes the reply
 * by its key (a socket, or other handlers subscribed to that key).
 */
class handler_interface
{
public:
	virtual ~handler_interface() = default;

	/**
	 * Type of the callback function passed to the handler by the reactor
	 */
	using response_cb = std::function<void(const message_container &)>;

	/**
	 * Process a message the handler is subscribed to
	 * @param message message to be processed
	 * @param respond callback that enables the handler to respond
	 */
	virtual void on_request(const message_container &message, const response_cb &respond) = 0;
};

#endif // NODEHUB_BROKER_HANDLER_INTERFACE_H
