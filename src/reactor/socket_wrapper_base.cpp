#include "socket_wrapper_base.h"


socket_wrapper_base::socket_wrapper_base(
	std::shared_ptr<zmq::context_t> context, zmq::socket_type type, const std::string &addr, bool bound)
	: socket_(*context, type), addr_(addr), bound_(bound)
{
	socket_.set(zmq::sockopt::linger, 0);
}

zmq::pollitem_t socket_wrapper_base::get_pollitem()
{
	return zmq::pollitem_t{socket_.handle(), 0, ZMQ_POLLIN, 0};
}

void socket_wrapper_base::initialize()
{
	if (bound_) {
		socket_.bind(addr_);
	} else {
		socket_.connect(addr_);
	}
}
