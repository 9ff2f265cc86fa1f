#include <cstdint>
#include <iterator>
#include <zmq_addon.hpp>

#include "reactor.h"

const std::string reactor::KEY_TIMER = "timer";
const std::chrono::milliseconds reactor::POLL_TIMEOUT = std::chrono::milliseconds(100);

namespace
{
	std::vector<std::string> frames_to_strings(std::vector<zmq::message_t>::const_iterator begin,
		std::vector<zmq::message_t>::const_iterator end)
	{
		std::vector<std::string> result;
		for (auto it = begin; it != end; ++it) {
			result.push_back(it->to_string());
		}
		return result;
	}

	void send_strings(zmq::socket_t &socket, const std::vector<std::string> &frames)
	{
		std::vector<zmq::const_buffer> buffers;
		for (auto &frame : frames) {
			buffers.push_back(zmq::buffer(frame));
		}
		zmq::send_multipart(socket, buffers);
	}
} // namespace

reactor::reactor(std::shared_ptr<zmq::context_t> context)
	: unique_id("reactor_" + std::to_string(reinterpret_cast<std::uintptr_t>(this))), context_(context),
	  async_handler_socket_(*context, zmq::socket_type::router), termination_flag_(false)
{
	async_handler_socket_.bind("inproc://" + unique_id);
}

void reactor::add_socket(const std::string &name, std::shared_ptr<socket_wrapper_base> socket)
{
	sockets_.emplace(name, socket);
}

void reactor::add_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler)
{
	auto wrapper = std::make_shared<handler_wrapper>(*this, handler);

	for (auto &origin : origins) {
		handlers_.emplace(origin, wrapper);
	}
}

void reactor::add_async_handler(const std::vector<std::string> &origins, std::shared_ptr<handler_interface> handler)
{
	auto wrapper = std::make_shared<asynchronous_handler_wrapper>(*context_, async_handler_socket_, *this, handler);

	for (auto &origin : origins) {
		handlers_.emplace(origin, wrapper);
	}
}

void reactor::send_message(const message_container &message)
{
	auto it = sockets_.find(message.key);

	if (it != std::end(sockets_)) {
		it->second->send_message(message);
	} else {
		process_message(message);
	}
}

void reactor::process_message(const message_container &message)
{
	auto range = handlers_.equal_range(message.key);

	for (auto it = range.first; it != range.second; ++it) {
		(*it->second)(message);
	}
}

void reactor::receive_async_response()
{
	std::vector<zmq::message_t> frames;
	if (!zmq::recv_multipart(async_handler_socket_, std::back_inserter(frames), zmq::recv_flags::dontwait)) {
		return;
	}

	// routing id of the handler, key and identity
	if (frames.size() < 3) {
		return;
	}

	message_container response;
	response.key = frames[1].to_string();
	response.identity = frames[2].to_string();
	response.data = frames_to_strings(frames.begin() + 3, frames.end());

	// responses of async handlers might be destined to a socket
	send_message(response);
}

void reactor::start_loop()
{
	std::vector<zmq::pollitem_t> pollitems;
	std::vector<std::string> pollitem_names;

	for (auto &it : sockets_) {
		it.second->initialize();
		pollitems.push_back(it.second->get_pollitem());
		pollitem_names.push_back(it.first);
	}

	// the internal socket for asynchronous communication is polled last
	pollitems.push_back(zmq::pollitem_t{async_handler_socket_.handle(), 0, ZMQ_POLLIN, 0});

	auto last_tick = std::chrono::steady_clock::now();

	while (!termination_flag_.load()) {
		zmq::poll(pollitems, POLL_TIMEOUT);

		for (std::size_t i = 0; i < pollitems.size(); ++i) {
			if (!(pollitems[i].revents & ZMQ_POLLIN)) {
				continue;
			}

			if (i < pollitem_names.size()) {
				message_container received_msg;
				received_msg.key = pollitem_names[i];

				if (sockets_.at(received_msg.key)->receive_message(received_msg)) {
					process_message(received_msg);
				}
			} else {
				receive_async_response();
			}
		}

		// whole iterations are measured, the sub-millisecond remainder is carried over to the next tick
		auto elapsed_time =
			std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - last_tick);
		last_tick += elapsed_time;

		process_message(message_container(KEY_TIMER, "", {std::to_string(elapsed_time.count())}));
	}

	handlers_.clear();
}

void reactor::terminate()
{
	termination_flag_.store(true);
}

handler_wrapper::handler_wrapper(reactor &reactor_ref, std::shared_ptr<handler_interface> handler)
	: handler_(handler), reactor_(reactor_ref)
{
}

void handler_wrapper::operator()(const message_container &message)
{
	handler_->on_request(message, [this](const message_container &response) { reactor_.send_message(response); });
}

const std::string asynchronous_handler_wrapper::TERMINATE_MSG = "TERMINATE";

asynchronous_handler_wrapper::asynchronous_handler_wrapper(zmq::context_t &context,
	zmq::socket_t &async_handler_socket,
	reactor &reactor_ref,
	std::shared_ptr<handler_interface> handler)
	: handler_wrapper(reactor_ref, handler), reactor_socket_(async_handler_socket),
	  unique_id_("handler_" + std::to_string(reinterpret_cast<std::uintptr_t>(this))),
	  worker_socket_(context, zmq::socket_type::dealer)
{
	worker_socket_.set(zmq::sockopt::routing_id, unique_id_);
	worker_socket_.set(zmq::sockopt::linger, 0);
	worker_socket_.connect("inproc://" + reactor_.unique_id);

	worker_ = std::thread([this]() { handler_thread(); });
}

asynchronous_handler_wrapper::~asynchronous_handler_wrapper()
{
	send_to_worker({TERMINATE_MSG});
	worker_.join();
}

void asynchronous_handler_wrapper::send_to_worker(const std::vector<std::string> &frames)
{
	std::vector<std::string> routed = {unique_id_};
	routed.insert(routed.end(), frames.begin(), frames.end());
	send_strings(reactor_socket_, routed);
}

void asynchronous_handler_wrapper::operator()(const message_container &message)
{
	std::vector<std::string> frames = {message.key, message.identity};
	frames.insert(frames.end(), message.data.begin(), message.data.end());
	send_to_worker(frames);
}

void asynchronous_handler_wrapper::handler_thread()
{
	zmq::socket_t &socket = worker_socket_;

	auto respond = [&socket](const message_container &response) {
		std::vector<std::string> frames = {response.key, response.identity};
		frames.insert(frames.end(), response.data.begin(), response.data.end());
		send_strings(socket, frames);
	};

	while (true) {
		std::vector<zmq::message_t> frames;
		if (!zmq::recv_multipart(socket, std::back_inserter(frames))) {
			continue;
		}

		if (frames.size() == 1 && frames.front().to_string() == TERMINATE_MSG) {
			return;
		}

		// key and identity are mandatory
		if (frames.size() < 2) {
			continue;
		}

		message_container request;
		request.key = frames[0].to_string();
		request.identity = frames[1].to_string();
		request.data = frames_to_strings(frames.begin() + 2, frames.end());

		handler_->on_request(request, respond);
	}
}
