#ifndef NODEHUB_BROKER_REACTOR_H
#define NODEHUB_BROKER_REACTOR_H

#include <atomic>
#include <map>
#include <memory>
#include <thread>
#include <vector>
#include <zmq.hpp>

#include "handler_interface.h"
#include "message_container.h"
#include "socket_wrapper_base.h"

class reactor;

/**
 * Calls the wrapped handler directly from the reactor thread.
 */
class handler_wrapper
{
public:
	/**
	 * @param reactor_ref reactor object which owns the handler
	 * @param handler the handler object
	 */
	handler_wrapper(reactor &reactor_ref, std::shared_ptr<handler_interface> handler);

	virtual ~handler_wrapper() = default;

	/**
	 * Pass a message to the handler, responses are routed by the reactor immediately
	 * @param message The message to be passed
	 */
	virtual void operator()(const message_container &message);

protected:
	/** The wrapped handler */
	std::shared_ptr<handler_interface> handler_;

	/** The reactor that owns the wrapper */
	reactor &reactor_;
};

/**
 * Runs the wrapped handler in its own (exactly one) thread.
 * Messages travel to the thread and responses back to the reactor through ZeroMQ inprocess sockets,
 * so the handler may block (sleep, wait on network) without stalling the reactor.
 */
class asynchronous_handler_wrapper : public handler_wrapper
{
public:
	/**
	 * @param context ZeroMQ context used to communicate with the reactor
	 * @param async_handler_socket The socket used to communicate with our worker thread (the reactor side)
	 * @param reactor_ref The reactor which owns the handler
	 * @param handler The handler object
	 */
	asynchronous_handler_wrapper(zmq::context_t &context,
		zmq::socket_t &async_handler_socket,
		reactor &reactor_ref,
		std::shared_ptr<handler_interface> handler);

	/**
	 * Send a termination message to the worker thread and join it.
	 * The ZeroMQ connection must still work for this to function.
	 */
	~asynchronous_handler_wrapper() override;

	/**
	 * Pass a copy of the message to the worker thread.
	 * @param message The message to be passed
	 */
	void operator()(const message_container &message) override;

private:
	/** Single frame message which stops the worker thread */
	static const std::string TERMINATE_MSG;

	/**
	 * The reactor side of the inprocess connection.
	 * It can only be used by the main reactor thread (i.e. not by the worker thread)
	 */
	zmq::socket_t &reactor_socket_;

	/** Routing id of our dealer socket on the reactor side */
	const std::string unique_id_;

	/** Dealer socket connected before the worker thread starts, used only by that thread afterwards */
	zmq::socket_t worker_socket_;

	std::thread worker_;

	/**
	 * The worker thread function. Loops until a termination message arrives from the reactor.
	 */
	void handler_thread();

	/**
	 * Send frames to the reactor side, prefixed by our routing id
	 */
	void send_to_worker(const std::vector<std::string> &frames);
};

/**
 * Provides an event-based API for ZeroMQ network communication. Messages are transferred through registered sockets
 * and processed by handlers who don't have to use ZeroMQ directly. Running the handlers asynchronously is also
 * supported.
 */
class reactor
{
public:
	/**
	 * Key of periodic messages carrying the milliseconds elapsed since the previous one
	 */
	static const std::string KEY_TIMER;

	/**
	 * Period of @ref KEY_TIMER messages when no traffic arrives
	 */
	static const std::chrono::milliseconds POLL_TIMEOUT;

	/**
	 * A unique identifier for the asynchronous handler socket
	 */
	const std::string unique_id;

	/**
	 * @param context A ZeroMQ context used to create sockets for asynchronous communication
	 */
	explicit reactor(std::shared_ptr<zmq::context_t> context);

	/**
	 * Add a socket to be polled by the reactor
	 * @param name a name used as the key for messages transmitted through the socket
	 * @param socket
	 */
	void add_socket(const std::string &name, std::shared_ptr<socket_wrapper_base> socket);

	/**
	 * Add a handler for messages from given origins that is invoked directly
	 * (reactor waits for its completion, any calls to a response callback are processed immediately).
	 * @param origins subscribed origins
	 * @param handler
	 */
	void add_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler);

	/**
	 * Add a handler for messages from given origins that is invoked asynchronously
	 * (messages are passed to it through an in-process socket pair, which is also used by the response callback).
	 * @param origins
	 * @param handler
	 */
	void add_async_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler);

	/**
	 * Send a message through the socket with matching key, or pass it to handlers subscribed to the key
	 * when there is no such socket.
	 * @param message frames of the message
	 */
	void send_message(const message_container &message);

	/**
	 * Pass a message received from one of the sockets to the handlers.
	 * @param message frames of the message
	 */
	void process_message(const message_container &message);

	/**
	 * Initialize all sockets and poll them, invoking handlers if needed.
	 * Handlers that need to keep track of elapsed time should subscribe to @ref KEY_TIMER.
	 *
	 * The loop can be interrupted using the @a terminate method. When this happens, all handlers will be
	 * destroyed.
	 */
	void start_loop();

	/**
	 * Tell the reactor to terminate as soon as possible.
	 * This method is thread-safe.
	 */
	void terminate();

private:
	/** Sockets indexed by their keys */
	std::map<std::string, std::shared_ptr<socket_wrapper_base>> sockets_;

	/** Handlers indexed by the keys of all the events they are subscribed to */
	std::multimap<std::string, std::shared_ptr<handler_wrapper>> handlers_;

	std::shared_ptr<zmq::context_t> context_;

	/** An in-process socket used to communicate with asynchronous handlers */
	zmq::socket_t async_handler_socket_;

	/** Flag used to tell the reactor to terminate the main loop */
	std::atomic<bool> termination_flag_;

	/**
	 * Read one response of an asynchronous handler and route it
	 */
	void receive_async_response();
};

#endif // NODEHUB_BROKER_REACTOR_H
