#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/handlers/broker_handler.h"
#include "../src/handlers/task_timer_handler.h"
#include "../src/helpers/string_to_hex.h"
#include "../src/protocol.h"
#include "../src/store/memory_store.h"
#include "mocks.h"

using namespace testing;

/**
 * Broker handler wired to in-memory state, responses are collected in messages.
 */
class broker_test : public Test
{
protected:
	std::shared_ptr<NiceMock<mock_broker_config>> config = std::make_shared<NiceMock<mock_broker_config>>();
	std::shared_ptr<capability_index> index = std::make_shared<capability_index>();
	std::shared_ptr<connection_registry> nodes =
		std::make_shared<connection_registry>(index, registration_policy::replace, 4);
	std::shared_ptr<memory_store> store = std::make_shared<memory_store>();
	std::shared_ptr<offline_queue> queue = std::make_shared<offline_queue>(store);
	std::shared_ptr<audit_log> audit = std::make_shared<audit_log>(store, 100);
	std::shared_ptr<message_router> router = std::make_shared<message_router>(nodes, index, queue, audit);
	std::shared_ptr<task_dispatcher> dispatcher =
		std::make_shared<task_dispatcher>(nodes, index, nullptr, std::chrono::milliseconds(30000));
	broker_handler handler{config, nodes, router, dispatcher, nullptr};

	// Dummy response callback
	std::vector<message_container> messages;
	handler_interface::response_cb respond = [this](const message_container &msg) { messages.push_back(msg); };

	void send(const std::string &identity, const std::string &command, const nlohmann::json &payload)
	{
		handler.on_request(message_container(broker_connect::KEY_NODES, identity, {command, payload.dump()}), respond);
	}

	void send(const std::string &identity, const std::string &command)
	{
		handler.on_request(message_container(broker_connect::KEY_NODES, identity, {command}), respond);
	}

	void register_node(const std::string &identity, const std::vector<std::string> &capabilities)
	{
		send(identity,
			protocol::CMD_REGISTER,
			{{"type", "worker"}, {"name", identity}, {"capabilities", capabilities}});
	}

	void tick(std::chrono::milliseconds elapsed)
	{
		handler.on_request(
			message_container(broker_connect::KEY_TIMER, "", {std::to_string(elapsed.count())}), respond);
	}
};

TEST_F(broker_test, register_first_node)
{
	register_node("identity1", {"compute", "storage"});

	auto node = nodes->find_by_identity("identity1");

	// Exactly one node should be present
	ASSERT_EQ(1u, nodes->size());
	ASSERT_NE(nullptr, node);
	ASSERT_EQ("worker", node->type);
	ASSERT_EQ("identity1", node->name);
	ASSERT_TRUE(node->has_capability("compute"));
	ASSERT_THAT(index->nodes_with("storage"), ElementsAre(node->id));

	// The newcomer gets the network status, nobody else to notify
	auto status = events_for(messages, "identity1", protocol::EVENT_NETWORK_STATUS);
	ASSERT_EQ(1u, status.size());
	ASSERT_EQ(1, status[0]["totalNodes"]);
	ASSERT_EQ(node->id, status[0]["nodes"][0]["id"]);
	ASSERT_EQ(1u, messages.size());
}

TEST_F(broker_test, register_notifies_others)
{
	register_node("identity1", {});
	messages.clear();

	register_node("identity2", {"compute"});

	auto joined = events_for(messages, "identity1", protocol::EVENT_NODE_JOINED);
	ASSERT_EQ(1u, joined.size());
	ASSERT_EQ(helpers::string_to_hex("identity2"), joined[0]["id"]);
	ASSERT_EQ("identity2", joined[0]["name"]);
	ASSERT_EQ(nlohmann::json({"compute"}), joined[0]["capabilities"]);

	// The newcomer does not hear about itself
	ASSERT_THAT(events_for(messages, "identity2", protocol::EVENT_NODE_JOINED), IsEmpty());

	auto status = events_for(messages, "identity2", protocol::EVENT_NETWORK_STATUS);
	ASSERT_EQ(1u, status.size());
	ASSERT_EQ(2, status[0]["totalNodes"]);
	ASSERT_EQ(2u, status[0]["nodes"].size());
}

TEST_F(broker_test, register_without_payload)
{
	send("identity1", protocol::CMD_REGISTER);

	auto registered = nodes->find_by_identity("identity1");
	ASSERT_NE(nullptr, registered);
	ASSERT_EQ("unknown", registered->type);
	ASSERT_EQ(node::default_name(registered->id), registered->name);
}

TEST_F(broker_test, repeated_register_replaces)
{
	register_node("identity1", {"compute"});
	register_node("identity1", {"gpu"});

	ASSERT_EQ(1u, nodes->size());
	ASSERT_THAT(index->nodes_with("compute"), IsEmpty());
	ASSERT_THAT(index->nodes_with("gpu"), ElementsAre(helpers::string_to_hex("identity1")));
	ASSERT_EQ(2u, events_for(messages, "identity1", protocol::EVENT_NETWORK_STATUS).size());
}

TEST_F(broker_test, repeated_register_rejected)
{
	auto strict_nodes = std::make_shared<connection_registry>(index, registration_policy::reject, 4);
	auto strict_router = std::make_shared<message_router>(strict_nodes, index, queue, audit);
	broker_handler strict(config, strict_nodes, strict_router, dispatcher, nullptr);

	auto registration = nlohmann::json{{"name", "first"}}.dump();
	strict.on_request(
		message_container(broker_connect::KEY_NODES, "identity1", {protocol::CMD_REGISTER, registration}), respond);
	messages.clear();

	registration = nlohmann::json{{"name", "second"}}.dump();
	strict.on_request(
		message_container(broker_connect::KEY_NODES, "identity1", {protocol::CMD_REGISTER, registration}), respond);

	auto errors = events_for(messages, "identity1", protocol::EVENT_REGISTER_ERROR);
	ASSERT_EQ(1u, errors.size());
	ASSERT_EQ("Node already registered on this connection", errors[0]["error"]);
	ASSERT_EQ("first", strict_nodes->find_by_identity("identity1")->name);
	ASSERT_EQ(1u, messages.size());
}

TEST_F(broker_test, capabilities_update)
{
	register_node("identity1", {"compute"});
	messages.clear();

	send("identity1", protocol::CMD_CAPABILITIES, {{"capabilities", {"gpu", "storage"}}});

	std::string id = helpers::string_to_hex("identity1");
	ASSERT_THAT(index->nodes_with("compute"), IsEmpty());
	ASSERT_THAT(index->nodes_with("gpu"), ElementsAre(id));
	ASSERT_THAT(nodes->lookup(id)->capabilities, ElementsAre("gpu", "storage"));

	// A bare array is accepted too
	send("identity1", protocol::CMD_CAPABILITIES, nlohmann::json::array({"compute"}));
	ASSERT_THAT(index->nodes_with("compute"), ElementsAre(id));

	ASSERT_TRUE(messages.empty());
}

TEST_F(broker_test, capabilities_before_register)
{
	send("identity1", protocol::CMD_CAPABILITIES, {{"capabilities", {"gpu"}}});

	// Nothing is indexed, nobody is answered
	ASSERT_THAT(index->nodes_with("gpu"), IsEmpty());
	ASSERT_EQ(0u, nodes->size());
	ASSERT_TRUE(messages.empty());
}

TEST_F(broker_test, message_to_capability)
{
	register_node("sender", {});
	register_node("worker1", {"compute"});
	register_node("worker2", {"compute"});
	register_node("worker3", {"storage"});
	messages.clear();

	send("sender", protocol::CMD_MESSAGE, {{"to", "type:compute"}, {"type", "job"}, {"payload", {{"n", 1}}}});

	ASSERT_EQ(1u, events_for(messages, "worker1", protocol::EVENT_MESSAGE).size());
	ASSERT_EQ(1u, events_for(messages, "worker2", protocol::EVENT_MESSAGE).size());
	ASSERT_THAT(events_for(messages, "worker3", protocol::EVENT_MESSAGE), IsEmpty());

	auto routed = events_for(messages, "sender", protocol::EVENT_MESSAGE_ROUTED);
	ASSERT_EQ(1u, routed.size());
	ASSERT_EQ("compute", routed[0]["targetCapability"]);
	ASSERT_EQ(2, routed[0]["routedCount"]);
}

TEST_F(broker_test, message_from_unregistered_connection)
{
	register_node("worker1", {});
	messages.clear();

	send("stranger", protocol::CMD_MESSAGE, {{"to", helpers::string_to_hex("worker1")}, {"payload", "hi"}});

	auto received = events_for(messages, "worker1", protocol::EVENT_MESSAGE);
	ASSERT_EQ(1u, received.size());
	ASSERT_EQ(helpers::string_to_hex("stranger"), received[0]["from"]);
	ASSERT_EQ("hi", received[0]["payload"]);
}

TEST_F(broker_test, queued_messages_delivered_on_register)
{
	register_node("sender", {});
	std::string late_id = helpers::string_to_hex("late");

	send("sender", protocol::CMD_MESSAGE, {{"to", late_id}, {"messageId", "m1"}, {"payload", 1}});
	send("sender", protocol::CMD_MESSAGE, {{"to", late_id}, {"messageId", "m2"}, {"payload", 2}});
	ASSERT_EQ(2u, events_for(messages, "sender", protocol::EVENT_MESSAGE_QUEUED).size());
	messages.clear();

	register_node("late", {});

	// Network status first, then the backlog in the order it was sent
	auto delivered = events_for(messages, "late", protocol::EVENT_MESSAGE);
	ASSERT_EQ(2u, delivered.size());
	ASSERT_EQ("m1", delivered[0]["id"]);
	ASSERT_EQ("m2", delivered[1]["id"]);
	std::vector<std::string> received;
	for (auto &msg : messages) {
		if (msg.identity == "late") {
			received.push_back(msg.get_frame(0));
		}
	}
	ASSERT_THAT(
		received, ElementsAre(protocol::EVENT_NETWORK_STATUS, protocol::EVENT_MESSAGE, protocol::EVENT_MESSAGE));
	ASSERT_EQ(0u, queue->get_queued_count());
}

TEST_F(broker_test, queued_messages_on_request)
{
	ON_CALL(*config, get_deliver_queued_on_register()).WillByDefault(Return(false));

	register_node("sender", {});
	std::string late_id = helpers::string_to_hex("late");
	send("sender", protocol::CMD_MESSAGE, {{"to", late_id}, {"messageId", "m1"}});

	register_node("late", {});
	ASSERT_THAT(events_for(messages, "late", protocol::EVENT_MESSAGE), IsEmpty());
	ASSERT_EQ(1u, queue->get_queued_count(late_id));

	send("late", protocol::CMD_FETCH_QUEUED);

	auto delivered = events_for(messages, "late", protocol::EVENT_MESSAGE);
	ASSERT_EQ(1u, delivered.size());
	ASSERT_EQ("m1", delivered[0]["id"]);
	ASSERT_EQ(0u, queue->get_queued_count());
}

TEST_F(broker_test, task_completed)
{
	register_node("client", {});
	register_node("worker1", {"compute"});
	messages.clear();

	send("client", protocol::CMD_TASK, {{"capability", "compute"}, {"payload", {{"n", 5}}}});

	auto assigned = events_for(messages, "worker1", protocol::EVENT_TASK_ASSIGNED);
	ASSERT_EQ(1u, assigned.size());
	std::string task_id = assigned[0]["taskId"].get<std::string>();
	ASSERT_EQ(1u, events_for(messages, "client", protocol::EVENT_TASK_DISPATCHED).size());
	messages.clear();

	send("worker1", protocol::CMD_TASK_RESULT, {{"taskId", task_id}, {"status", "completed"}, {"result", 25}});

	auto completed = events_for(messages, "client", protocol::EVENT_TASK_COMPLETED);
	ASSERT_EQ(1u, completed.size());
	ASSERT_EQ(task_id, completed[0]["taskId"]);
	ASSERT_EQ(25, completed[0]["result"]);
	ASSERT_EQ(0u, dispatcher->get_active_count());
}

TEST_F(broker_test, task_without_capable_node)
{
	register_node("client", {});
	messages.clear();

	send("client", protocol::CMD_TASK, {{"capability", "gpu"}});

	auto errors = events_for(messages, "client", protocol::EVENT_TASK_ERROR);
	ASSERT_EQ(1u, errors.size());
	ASSERT_EQ("No nodes available with capability: gpu", errors[0]["error"]);
	ASSERT_EQ(0u, dispatcher->get_active_count());
}

TEST_F(broker_test, task_timeout_through_timer_lane)
{
	auto now = std::chrono::steady_clock::time_point();
	task_timer_handler timers(nullptr, [&now]() { return now; });
	register_node("client", {});
	register_node("worker1", {"compute"});
	messages.clear();

	send("client", protocol::CMD_TASK, {{"capability", "compute"}, {"timeoutMs", 100}});
	auto assigned = events_for(messages, "worker1", protocol::EVENT_TASK_ASSIGNED);
	ASSERT_EQ(1u, assigned.size());
	std::string task_id = assigned[0]["taskId"].get<std::string>();

	// Hand the arm request over to the timer lane
	std::vector<message_container> timer_output;
	auto timer_respond = [&timer_output](const message_container &msg) { timer_output.push_back(msg); };
	for (auto &msg : messages_for(messages, broker_connect::KEY_TASK_TIMER)) {
		timers.on_request(msg, timer_respond);
	}
	messages.clear();

	// The worker leaves without answering, the timer keeps running
	send("worker1", protocol::CMD_DISCONNECT);
	ASSERT_EQ(nullptr, nodes->find_by_identity("worker1"));
	ASSERT_THAT(messages_for(messages, broker_connect::KEY_TASK_TIMER), IsEmpty());
	ASSERT_EQ(1u, timers.get_armed_count());
	ASSERT_EQ(1u, dispatcher->get_active_count());

	now += std::chrono::milliseconds(60);
	timers.on_request(message_container(broker_connect::KEY_TIMER, "", {"60"}), timer_respond);
	ASSERT_TRUE(timer_output.empty());
	now += std::chrono::milliseconds(60);
	timers.on_request(message_container(broker_connect::KEY_TIMER, "", {"60"}), timer_respond);
	ASSERT_THAT(timer_output, ElementsAre(message_container(broker_connect::KEY_TASK_EXPIRED, "", {task_id})));

	handler.on_request(timer_output.front(), respond);

	auto timeouts = events_for(messages, "client", protocol::EVENT_TASK_TIMEOUT);
	ASSERT_EQ(1u, timeouts.size());
	ASSERT_EQ(task_id, timeouts[0]["taskId"]);
	ASSERT_THAT(events_for(messages, "client", protocol::EVENT_TASK_ERROR), IsEmpty());
	messages.clear();

	// A second expiration of the same task is ignored
	handler.on_request(timer_output.front(), respond);
	ASSERT_THAT(events_for(messages, "client", protocol::EVENT_TASK_TIMEOUT), IsEmpty());

	// A late result changes nothing
	send("worker1", protocol::CMD_TASK_RESULT, {{"taskId", task_id}, {"result", 1}});
	ASSERT_THAT(events_for(messages, "client", protocol::EVENT_TASK_COMPLETED), IsEmpty());
	ASSERT_EQ(1u, dispatcher->get_timed_out_count());
	ASSERT_EQ(0u, dispatcher->get_completed_count());
}

TEST_F(broker_test, ping)
{
	send("identity1", protocol::CMD_PING);
	ASSERT_THAT(messages, ElementsAre(protocol::make_event("identity1", protocol::EVENT_INTRO)));
	messages.clear();

	register_node("identity1", {});
	messages.clear();

	send("identity1", protocol::CMD_PING);
	ASSERT_THAT(messages, ElementsAre(protocol::make_event("identity1", protocol::EVENT_PONG)));
}

TEST_F(broker_test, disconnect)
{
	register_node("identity1", {"compute"});
	register_node("identity2", {});
	messages.clear();

	send("identity1", protocol::CMD_DISCONNECT);

	ASSERT_EQ(1u, nodes->size());
	ASSERT_EQ(nullptr, nodes->find_by_identity("identity1"));
	ASSERT_THAT(index->nodes_with("compute"), IsEmpty());

	auto left = events_for(messages, "identity2", protocol::EVENT_NODE_LEFT);
	ASSERT_EQ(1u, left.size());
	ASSERT_EQ(helpers::string_to_hex("identity1"), left[0]["id"]);
	ASSERT_THAT(events_for(messages, "identity1", protocol::EVENT_NODE_LEFT), IsEmpty());

	// Disconnecting twice is harmless
	messages.clear();
	send("identity1", protocol::CMD_DISCONNECT);
	ASSERT_TRUE(messages.empty());
}

TEST_F(broker_test, liveness_expiry)
{
	register_node("identity1", {"compute"});
	register_node("identity2", {});
	messages.clear();

	// identity2 keeps talking, identity1 goes silent
	for (int i = 0; i < 3; ++i) {
		tick(std::chrono::milliseconds(1100));
		send("identity2", protocol::CMD_PING);
	}
	ASSERT_EQ(2u, nodes->size());

	tick(std::chrono::milliseconds(1100));

	ASSERT_EQ(1u, nodes->size());
	ASSERT_EQ(nullptr, nodes->find_by_identity("identity1"));
	ASSERT_NE(nullptr, nodes->find_by_identity("identity2"));
	ASSERT_THAT(index->nodes_with("compute"), IsEmpty());
	ASSERT_EQ(1u, events_for(messages, "identity2", protocol::EVENT_NODE_LEFT).size());
}

TEST_F(broker_test, malformed_frames)
{
	// Invalid JSON payload
	handler.on_request(
		message_container(broker_connect::KEY_NODES, "identity1", {protocol::CMD_REGISTER, "{oops"}), respond);
	// Task without capability
	send("identity1", protocol::CMD_TASK, {{"payload", 1}});
	// Unknown command
	send("identity1", "reboot");

	auto errors = events_for(messages, "identity1", protocol::EVENT_ERROR);
	ASSERT_EQ(3u, errors.size());
	ASSERT_EQ("Unknown command 'reboot'", errors[2]["error"]);
	ASSERT_EQ(0u, nodes->size());

	// Empty frame is dropped silently
	messages.clear();
	handler.on_request(message_container(broker_connect::KEY_NODES, "identity1", {}), respond);
	ASSERT_TRUE(messages.empty());
}

TEST_F(broker_test, event_notifier)
{
	config->notifier.address = "http://hooks.local";

	register_node("identity1", {});
	send("identity1", protocol::CMD_DISCONNECT);

	auto events = messages_for(messages, broker_connect::KEY_EVENT_NOTIFIER);
	ASSERT_EQ(2u, events.size());
	ASSERT_THAT(events[0].data,
		ElementsAre("type", "node-status", "id", helpers::string_to_hex("identity1"), "status", "online", "name",
			"identity1"));
	ASSERT_THAT(events[1].data,
		ElementsAre("type", "node-status", "id", helpers::string_to_hex("identity1"), "status", "offline", "name",
			"identity1"));
}

TEST_F(broker_test, event_notifier_task_rejections)
{
	config->notifier.address = "http://hooks.local";
	register_node("client", {});

	// an index entry without a registered node makes the selected node unavailable
	index->advertise("6768c3b3", {"gpu"});
	messages.clear();

	send("client", protocol::CMD_TASK, {{"capability", "compute"}});
	send("client", protocol::CMD_TASK, {{"capability", "gpu"}});

	auto errors = events_for(messages, "client", protocol::EVENT_TASK_ERROR);
	ASSERT_EQ(2u, errors.size());

	auto events = messages_for(messages, broker_connect::KEY_EVENT_NOTIFIER);
	ASSERT_EQ(2u, events.size());
	ASSERT_THAT(events[0].data,
		ElementsAre("type", "task-status", "id", errors[0]["taskId"].get<std::string>(), "status", "REJECTED",
			"message", "No nodes available with capability: compute"));
	ASSERT_THAT(events[1].data,
		ElementsAre("type", "task-status", "id", errors[1]["taskId"].get<std::string>(), "status", "REJECTED",
			"message", "Selected node not available"));
}

TEST_F(broker_test, event_notifier_disabled)
{
	register_node("identity1", {});
	send("identity1", protocol::CMD_DISCONNECT);

	ASSERT_THAT(messages_for(messages, broker_connect::KEY_EVENT_NOTIFIER), IsEmpty());
}
