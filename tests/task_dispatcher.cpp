#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/dispatch/task_dispatcher.h"
#include "../src/handlers/task_timer_handler.h"
#include "../src/helpers/string_to_hex.h"
#include "../src/protocol.h"
#include "mocks.h"

using namespace testing;

class task_dispatcher_test : public Test
{
protected:
	std::shared_ptr<capability_index> index = std::make_shared<capability_index>();
	std::shared_ptr<connection_registry> nodes = std::make_shared<connection_registry>(index);
	std::shared_ptr<NiceMock<mock_node_selector>> selector = std::make_shared<NiceMock<mock_node_selector>>();
	task_dispatcher dispatcher{nodes, index, selector, std::chrono::milliseconds(30000)};

	std::vector<message_container> messages;
	handler_interface::response_cb respond = [this](const message_container &msg) { messages.push_back(msg); };

	const std::string worker_1_id = helpers::string_to_hex("worker-1");
	const std::string worker_2_id = helpers::string_to_hex("worker-2");

	void SetUp() override
	{
		register_node("client", {});
		register_node("worker-1", {"compute"});
		register_node("worker-2", {"compute"});

		// first candidate unless a test says otherwise
		ON_CALL(*selector, select(_)).WillByDefault(Invoke([](const std::vector<std::string> &candidates) {
			return candidates.front();
		}));
	}

	void register_node(const std::string &identity, const std::set<std::string> &capabilities)
	{
		registration_info info;
		info.name = identity;
		info.capabilities = capabilities;
		nodes->register_node(identity, info);
	}

	task_request make_request(
		const std::string &capability, std::chrono::milliseconds timeout = std::chrono::milliseconds(-1))
	{
		task_request request;
		request.capability = capability;
		request.payload = {{"n", 42}};
		request.timeout = timeout;
		return request;
	}

	task_result make_result(const std::string &task_id, bool succeeded)
	{
		task_result result;
		result.task_id = task_id;
		result.succeeded = succeeded;
		result.result = {{"answer", 1}};
		result.error = succeeded ? "" : "crashed";
		return result;
	}
};

TEST_F(task_dispatcher_test, dispatch)
{
	auto result = dispatcher.dispatch("client", make_request("compute", std::chrono::milliseconds(500)), respond);

	ASSERT_EQ(dispatch_result::status::dispatched, result.outcome);
	EXPECT_EQ(worker_1_id, result.assigned_to);
	EXPECT_EQ(1u, dispatcher.get_active_count());

	auto assigned = events_for(messages, "worker-1", protocol::EVENT_TASK_ASSIGNED);
	ASSERT_EQ(1u, assigned.size());
	EXPECT_EQ(result.task_id, assigned[0]["taskId"]);
	EXPECT_EQ("compute", assigned[0]["capability"]);
	EXPECT_EQ(42, assigned[0]["payload"]["n"]);
	EXPECT_EQ("normal", assigned[0]["priority"]);
	EXPECT_EQ(helpers::string_to_hex("client"), assigned[0]["from"]);

	auto dispatched = events_for(messages, "client", protocol::EVENT_TASK_DISPATCHED);
	ASSERT_EQ(1u, dispatched.size());
	EXPECT_EQ(result.task_id, dispatched[0]["taskId"]);
	EXPECT_EQ(worker_1_id, dispatched[0]["assignedTo"]);

	auto timers = messages_for(messages, broker_connect::KEY_TASK_TIMER);
	ASSERT_EQ(1u, timers.size());
	EXPECT_THAT(timers[0].data, ElementsAre(task_timer_handler::CMD_ARM, result.task_id, "500"));
}

TEST_F(task_dispatcher_test, default_timeout)
{
	auto result = dispatcher.dispatch("client", make_request("compute"), respond);

	auto timers = messages_for(messages, broker_connect::KEY_TASK_TIMER);
	ASSERT_EQ(1u, timers.size());
	EXPECT_THAT(timers[0].data, ElementsAre(task_timer_handler::CMD_ARM, result.task_id, "30000"));
	EXPECT_EQ(std::chrono::milliseconds(30000), dispatcher.find_task(result.task_id)->timeout);
}

TEST_F(task_dispatcher_test, zero_timeout_is_kept)
{
	auto result = dispatcher.dispatch("client", make_request("compute", std::chrono::milliseconds(0)), respond);

	auto timers = messages_for(messages, broker_connect::KEY_TASK_TIMER);
	ASSERT_EQ(1u, timers.size());
	EXPECT_THAT(timers[0].data, ElementsAre(task_timer_handler::CMD_ARM, result.task_id, "0"));
	EXPECT_EQ(std::chrono::milliseconds(0), dispatcher.find_task(result.task_id)->timeout);
}

TEST_F(task_dispatcher_test, no_capable_node)
{
	EXPECT_CALL(*selector, select(_)).Times(0);

	auto result = dispatcher.dispatch("client", make_request("gpu"), respond);

	ASSERT_EQ(dispatch_result::status::no_capable_node, result.outcome);
	EXPECT_EQ(0u, dispatcher.get_active_count());
	EXPECT_EQ(nullptr, dispatcher.find_task(result.task_id));
	EXPECT_EQ(1u, dispatcher.get_rejected_count());

	auto errors = events_for(messages, "client", protocol::EVENT_TASK_ERROR);
	ASSERT_EQ(1u, errors.size());
	EXPECT_EQ(result.task_id, errors[0]["taskId"]);
	EXPECT_EQ("No nodes available with capability: gpu", errors[0]["error"]);
	EXPECT_THAT(messages_for(messages, broker_connect::KEY_TASK_TIMER), IsEmpty());
}

TEST_F(task_dispatcher_test, requester_is_not_a_candidate)
{
	register_node("client", {"compute"});

	EXPECT_CALL(*selector, select(UnorderedElementsAre(worker_1_id, worker_2_id)))
		.WillOnce(Return(worker_2_id));

	auto result = dispatcher.dispatch("client", make_request("compute"), respond);
	EXPECT_EQ(worker_2_id, result.assigned_to);
	EXPECT_EQ(1u, events_for(messages, "worker-2", protocol::EVENT_TASK_ASSIGNED).size());
}

TEST_F(task_dispatcher_test, selected_node_unavailable)
{
	auto stale = std::make_shared<NiceMock<mock_capability_index>>();
	std::string gone = helpers::string_to_hex("gone");
	ON_CALL(*stale, nodes_with("compute")).WillByDefault(Return(capability_index::id_set{gone}));

	task_dispatcher stale_dispatcher(nodes, stale, selector, std::chrono::milliseconds(1000));
	auto result = stale_dispatcher.dispatch("client", make_request("compute"), respond);

	ASSERT_EQ(dispatch_result::status::node_unavailable, result.outcome);
	EXPECT_EQ(0u, stale_dispatcher.get_active_count());

	auto errors = events_for(messages, "client", protocol::EVENT_TASK_ERROR);
	ASSERT_EQ(1u, errors.size());
	EXPECT_EQ("Selected node not available", errors[0]["error"]);
}

TEST_F(task_dispatcher_test, complete)
{
	auto dispatched = dispatcher.dispatch("client", make_request("compute"), respond);
	messages.clear();

	auto finished = dispatcher.complete("worker-1", make_result(dispatched.task_id, true), respond);

	ASSERT_NE(nullptr, finished);
	EXPECT_EQ(task_state::completed, finished->state);
	EXPECT_EQ(0u, dispatcher.get_active_count());
	EXPECT_EQ(1u, dispatcher.get_completed_count());

	auto completed = events_for(messages, "client", protocol::EVENT_TASK_COMPLETED);
	ASSERT_EQ(1u, completed.size());
	EXPECT_EQ(dispatched.task_id, completed[0]["taskId"]);
	EXPECT_EQ(worker_1_id, completed[0]["assignedTo"]);
	EXPECT_EQ(1, completed[0]["result"]["answer"]);

	auto timers = messages_for(messages, broker_connect::KEY_TASK_TIMER);
	ASSERT_EQ(1u, timers.size());
	EXPECT_THAT(timers[0].data, ElementsAre(task_timer_handler::CMD_CANCEL, dispatched.task_id));
}

TEST_F(task_dispatcher_test, failed)
{
	auto dispatched = dispatcher.dispatch("client", make_request("compute"), respond);
	messages.clear();

	auto finished = dispatcher.complete("worker-1", make_result(dispatched.task_id, false), respond);

	ASSERT_NE(nullptr, finished);
	EXPECT_EQ(task_state::failed, finished->state);
	EXPECT_EQ(1u, dispatcher.get_failed_count());

	auto failed = events_for(messages, "client", protocol::EVENT_TASK_FAILED);
	ASSERT_EQ(1u, failed.size());
	EXPECT_EQ("crashed", failed[0]["error"]);
}

TEST_F(task_dispatcher_test, result_from_other_node_ignored)
{
	auto dispatched = dispatcher.dispatch("client", make_request("compute"), respond);
	messages.clear();

	EXPECT_EQ(nullptr, dispatcher.complete("worker-2", make_result(dispatched.task_id, true), respond));
	EXPECT_EQ(nullptr, dispatcher.complete("worker-1", make_result("unknown", true), respond));

	EXPECT_THAT(messages, IsEmpty());
	EXPECT_EQ(1u, dispatcher.get_active_count());
}

TEST_F(task_dispatcher_test, expire)
{
	auto dispatched = dispatcher.dispatch("client", make_request("compute"), respond);
	messages.clear();

	auto expired = dispatcher.expire(dispatched.task_id, respond);

	ASSERT_NE(nullptr, expired);
	EXPECT_EQ(task_state::timed_out, expired->state);
	EXPECT_EQ(1u, dispatcher.get_timed_out_count());

	auto timeouts = events_for(messages, "client", protocol::EVENT_TASK_TIMEOUT);
	ASSERT_EQ(1u, timeouts.size());
	EXPECT_EQ(dispatched.task_id, timeouts[0]["taskId"]);
}

TEST_F(task_dispatcher_test, exactly_one_outcome)
{
	auto first = dispatcher.dispatch("client", make_request("compute"), respond);
	auto second = dispatcher.dispatch("client", make_request("compute"), respond);
	messages.clear();

	// completed first, the late timer is a no-op
	ASSERT_NE(nullptr, dispatcher.complete("worker-1", make_result(first.task_id, true), respond));
	EXPECT_EQ(nullptr, dispatcher.expire(first.task_id, respond));

	// timed out first, the late result is dropped
	ASSERT_NE(nullptr, dispatcher.expire(second.task_id, respond));
	EXPECT_EQ(nullptr, dispatcher.complete("worker-1", make_result(second.task_id, true), respond));

	EXPECT_EQ(1u, events_for(messages, "client", protocol::EVENT_TASK_COMPLETED).size());
	EXPECT_EQ(1u, events_for(messages, "client", protocol::EVENT_TASK_TIMEOUT).size());
	EXPECT_EQ(0u, dispatcher.get_active_count());
	EXPECT_EQ(2u, dispatcher.get_dispatched_count());
}

TEST(random_node_selector, picks_candidate)
{
	random_node_selector selector;
	std::vector<std::string> candidates = {"a", "b", "c"};

	for (int i = 0; i < 20; ++i) {
		EXPECT_THAT(candidates, Contains(selector.select(candidates)));
	}
	EXPECT_EQ("x", selector.select({"x"}));
}
