#include "message_router.h"
#include "../helpers/string_to_hex.h"
#include "../helpers/timestamp.h"
#include "../helpers/uuid.h"
#include "../protocol.h"


message_router::message_router(std::shared_ptr<connection_registry> nodes,
	std::shared_ptr<capability_index> capabilities,
	std::shared_ptr<offline_queue> queue,
	std::shared_ptr<audit_log> audit,
	std::shared_ptr<spdlog::logger> logger)
	: nodes_(nodes), capabilities_(capabilities), queue_(queue), audit_(audit), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

std::size_t message_router::send_to_all(const std::string &except,
	const std::string &event,
	const nlohmann::json &payload,
	const handler_interface::response_cb &respond)
{
	std::size_t count = 0;
	for (auto &target : nodes_->get_nodes()) {
		if (target->id == except) {
			continue;
		}
		respond(protocol::make_event(target->identity, event, payload));
		++count;
	}
	return count;
}

route_result message_router::route(
	const std::string &from_identity, const message_request &request, const handler_interface::response_cb &respond)
{
	std::string from = helpers::string_to_hex(from_identity);
	std::string id = request.message_id.empty() ? helpers::generate_uuid() : request.message_id;
	auto msg = std::make_shared<const message>(
		id, from, request.to, request.type, request.payload, helpers::timestamp_now());

	route_result result{route_result::route_kind::direct, 0, msg};

	if (request.is_broadcast()) {
		result.kind = route_result::route_kind::broadcast;
		result.delivered = send_to_all(from, protocol::EVENT_MESSAGE, msg->to_json(), respond);
		logger_->debug("Message {} from {} broadcast to {} nodes", id, from, result.delivered);
	} else if (request.is_capability_class()) {
		std::string capability = request.get_capability();
		result.kind = route_result::route_kind::capability;

		for (auto &node_id : capabilities_->nodes_with(capability)) {
			if (node_id == from) {
				continue;
			}

			// the index snapshot may be stale, only connected nodes count
			node_ptr target = nodes_->lookup(node_id);
			if (target == nullptr) {
				continue;
			}

			respond(protocol::make_event(target->identity, protocol::EVENT_MESSAGE, msg->to_json()));
			++result.delivered;
		}

		respond(protocol::make_event(from_identity,
			protocol::EVENT_MESSAGE_ROUTED,
			{{"messageId", id}, {"targetCapability", capability}, {"routedCount", result.delivered}}));
		logger_->debug("Message {} from {} routed to {} nodes with {}", id, from, result.delivered, capability);
	} else {
		node_ptr target = nodes_->lookup(request.to);
		if (target != nullptr) {
			respond(protocol::make_event(target->identity, protocol::EVENT_MESSAGE, msg->to_json()));
			result.delivered = 1;
			logger_->debug("Message {} from {} delivered to {}", id, from, target->get_description());
		} else {
			result.kind = route_result::route_kind::queued;
			queue_->enqueue(request.to, msg);
			respond(protocol::make_event(
				from_identity, protocol::EVENT_MESSAGE_QUEUED, {{"messageId", id}, {"to", request.to}}));
			logger_->debug("Message {} from {} queued for absent node {}", id, from, request.to);
		}
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (result.kind == route_result::route_kind::queued) {
			++queued_;
		} else if (result.delivered > 0) {
			++routed_;
		}
	}

	audit_->record(*msg);
	return result;
}

std::size_t message_router::broadcast_external(
	const nlohmann::json &payload, const handler_interface::response_cb &respond)
{
	auto msg = std::make_shared<const message>(helpers::generate_uuid(),
		"",
		protocol::BROADCAST_TOKEN,
		protocol::EVENT_BROADCAST,
		payload,
		helpers::timestamp_now());

	std::size_t count = send_to_all("", protocol::EVENT_BROADCAST, payload, respond);
	logger_->info("Management broadcast {} sent to {} nodes", msg->id, count);

	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (count > 0) {
			++routed_;
		}
	}

	audit_->record(*msg);
	return count;
}

std::size_t message_router::deliver_queued(const std::string &identity, const handler_interface::response_cb &respond)
{
	std::string node_id = helpers::string_to_hex(identity);
	auto messages = queue_->drain(node_id);

	for (auto &msg : messages) {
		respond(protocol::make_event(identity, protocol::EVENT_MESSAGE, msg->to_json()));
	}

	if (!messages.empty()) {
		logger_->info("Delivered {} queued messages to {}", messages.size(), node_id);
	}
	return messages.size();
}

std::size_t message_router::get_routed_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return routed_;
}

std::size_t message_router::get_queued_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return queued_;
}
