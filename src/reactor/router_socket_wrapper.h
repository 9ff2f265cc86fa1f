#ifndef NODEHUB_BROKER_ROUTER_SOCKET_WRAPPER_H
#define NODEHUB_BROKER_ROUTER_SOCKET_WRAPPER_H

#include <zmq.hpp>

#include "socket_wrapper_base.h"

/**
 * Wraps a ZeroMQ router socket.
 * The first frame of every message is the routing id of the peer, it is stored in (taken from) the identity
 * of the message container. A peer reconnecting with the same routing id takes over its previous connection.
 * Messages for peers which are not connected are silently dropped.
 */
class router_socket_wrapper : public socket_wrapper_base
{
public:
	/**
	 * @param context a ZeroMQ context
	 * @param addr address used by the socket
	 * @param bound true if the socket should bind, false if it connects
	 */
	router_socket_wrapper(std::shared_ptr<zmq::context_t> context, const std::string &addr, bool bound);

	~router_socket_wrapper() override = default;

	bool send_message(const message_container &message) override;

	bool receive_message(message_container &target) override;
};

#endif // NODEHUB_BROKER_ROUTER_SOCKET_WRAPPER_H
