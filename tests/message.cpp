#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/dispatch/task.h"
#include "../src/message.h"
#include "../src/protocol.h"

using namespace testing;

TEST(message, to_json)
{
	message msg("m1", "696431", "696432", "chat", {{"text", "hi"}}, "2024-01-01T00:00:00.000Z");

	auto json = msg.to_json();
	EXPECT_EQ("m1", json["id"]);
	EXPECT_EQ("696431", json["from"]);
	EXPECT_EQ("696432", json["to"]);
	EXPECT_EQ("chat", json["type"]);
	EXPECT_EQ("hi", json["payload"]["text"]);
	EXPECT_EQ("2024-01-01T00:00:00.000Z", json["timestamp"]);
}

TEST(message, to_json_without_recipient)
{
	message msg("m1", "696431", "", "chat", nullptr, "2024-01-01T00:00:00.000Z");

	EXPECT_EQ(0u, msg.to_json().count("to"));
}

TEST(message, from_json)
{
	auto msg = message::from_json(nlohmann::json::parse(
		R"({"id": "m2", "from": "aa", "to": "bb", "type": "t", "payload": [1, 2], "timestamp": "ts"})"));

	EXPECT_EQ("m2", msg.id);
	EXPECT_EQ("aa", msg.from);
	EXPECT_EQ("bb", msg.to);
	EXPECT_EQ("t", msg.type);
	EXPECT_EQ(nlohmann::json({1, 2}), msg.payload);
	EXPECT_EQ("ts", msg.timestamp);

	ASSERT_THROW(message::from_json(nlohmann::json::parse(R"({"from": "aa"})")), protocol_error);
	ASSERT_THROW(message::from_json(nlohmann::json::parse("42")), protocol_error);
}

TEST(message_request, targets)
{
	message_request request;
	EXPECT_TRUE(request.is_broadcast());

	request.to = "broadcast";
	EXPECT_TRUE(request.is_broadcast());
	EXPECT_FALSE(request.is_capability_class());

	request.to = "type:compute";
	EXPECT_FALSE(request.is_broadcast());
	EXPECT_TRUE(request.is_capability_class());
	EXPECT_EQ("compute", request.get_capability());

	request.to = "696431";
	EXPECT_FALSE(request.is_broadcast());
	EXPECT_FALSE(request.is_capability_class());
	EXPECT_EQ("", request.get_capability());
}

TEST(message_request, from_json)
{
	auto request = message_request::from_json(
		nlohmann::json::parse(R"({"to": "type:gpu", "type": "job", "payload": {"a": 1}, "messageId": "x1"})"));

	EXPECT_EQ("type:gpu", request.to);
	EXPECT_EQ("job", request.type);
	EXPECT_EQ(1, request.payload["a"]);
	EXPECT_EQ("x1", request.message_id);

	ASSERT_THROW(message_request::from_json(nlohmann::json::parse(R"({"to": 5})")), protocol_error);
	ASSERT_THROW(message_request::from_json(nlohmann::json()), protocol_error);
}

TEST(task_request, from_json)
{
	auto request = task_request::from_json(nlohmann::json::parse(
		R"({"capability": "compute", "payload": {"n": 3}, "priority": "high", "timeoutMs": 500})"));

	EXPECT_EQ("compute", request.capability);
	EXPECT_EQ(3, request.payload["n"]);
	EXPECT_EQ("high", request.priority);
	EXPECT_EQ(std::chrono::milliseconds(500), request.timeout);

	auto defaults = task_request::from_json(nlohmann::json::parse(R"({"capability": "compute"})"));
	EXPECT_EQ("normal", defaults.priority);
	EXPECT_FALSE(defaults.has_timeout());

	auto immediate = task_request::from_json(nlohmann::json::parse(R"({"capability": "compute", "timeoutMs": 0})"));
	EXPECT_TRUE(immediate.has_timeout());
	EXPECT_EQ(std::chrono::milliseconds(0), immediate.timeout);
	EXPECT_TRUE(defaults.payload.is_null());
}

TEST(task_request, malformed)
{
	ASSERT_THROW(task_request::from_json(nlohmann::json::parse(R"({"payload": 1})")), protocol_error);
	ASSERT_THROW(task_request::from_json(nlohmann::json::parse(R"({"capability": ""})")), protocol_error);
	ASSERT_THROW(
		task_request::from_json(nlohmann::json::parse(R"({"capability": "c", "timeoutMs": -1})")), protocol_error);
	ASSERT_THROW(
		task_request::from_json(nlohmann::json::parse(R"({"capability": "c", "timeout": "soon"})")), protocol_error);
	ASSERT_THROW(task_request::from_json(nlohmann::json()), protocol_error);
}

TEST(task_result, from_json)
{
	auto done = task_result::from_json(nlohmann::json::parse(R"({"taskId": "t1", "result": {"sum": 3}})"));
	EXPECT_EQ("t1", done.task_id);
	EXPECT_TRUE(done.succeeded);
	EXPECT_EQ(3, done.result["sum"]);

	auto failed =
		task_result::from_json(nlohmann::json::parse(R"({"taskId": "t2", "status": "failed", "error": "boom"})"));
	EXPECT_FALSE(failed.succeeded);
	EXPECT_EQ("boom", failed.error);

	ASSERT_THROW(task_result::from_json(nlohmann::json::parse(R"({"status": "completed"})")), protocol_error);
	ASSERT_THROW(
		task_result::from_json(nlohmann::json::parse(R"({"taskId": "t3", "status": "maybe"})")), protocol_error);
}

TEST(task, assignment_json)
{
	task_request request;
	request.capability = "compute";
	request.payload = {{"n", 1}};

	task item("t1", request, std::chrono::milliseconds(100), "id1", "696432");

	auto json = item.to_assignment_json();
	EXPECT_EQ("t1", json["taskId"]);
	EXPECT_EQ("compute", json["capability"]);
	EXPECT_EQ(1, json["payload"]["n"]);
	EXPECT_EQ("normal", json["priority"]);
	EXPECT_EQ("696431", json["from"]);
	EXPECT_TRUE(json["timestamp"].is_string());
	EXPECT_EQ(task_state::dispatched, item.state);
	EXPECT_EQ("DISPATCHED", task_state_to_string(item.state));
	EXPECT_EQ("TIMED_OUT", task_state_to_string(task_state::timed_out));
}
