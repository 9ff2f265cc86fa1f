#include "router_socket_wrapper.h"

#include <iterator>
#include <zmq_addon.hpp>

router_socket_wrapper::router_socket_wrapper(
	std::shared_ptr<zmq::context_t> context, const std::string &addr, bool bound)
	: socket_wrapper_base(context, zmq::socket_type::router, addr, bound)
{
	socket_.set(zmq::sockopt::router_handover, 1);
}

bool router_socket_wrapper::send_message(const message_container &source)
{
	std::vector<zmq::const_buffer> frames;
	frames.reserve(source.data.size() + 1);
	frames.push_back(zmq::buffer(source.identity));
	for (auto &frame : source.data) {
		frames.push_back(zmq::buffer(frame));
	}

	try {
		// dropped when the pipe of the peer is full
		return zmq::send_multipart(socket_, frames, zmq::send_flags::dontwait).has_value();
	} catch (const zmq::error_t &) {
		return false;
	}
}

bool router_socket_wrapper::receive_message(message_container &target)
{
	std::vector<zmq::message_t> frames;
	target.data.clear();

	try {
		if (!zmq::recv_multipart(socket_, std::back_inserter(frames), zmq::recv_flags::dontwait)) {
			return false;
		}
	} catch (const zmq::error_t &) {
		return false;
	}

	if (frames.empty()) {
		return false;
	}

	target.identity = frames.front().to_string();
	for (auto it = std::next(frames.begin()); it != frames.end(); ++it) {
		target.data.push_back(it->to_string());
	}

	return true;
}
