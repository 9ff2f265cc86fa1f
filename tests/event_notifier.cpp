#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/handlers/event_notifier_handler.h"
#include "../src/notifier/reactor_event_notifier.h"
#include "mocks.h"

using namespace testing;

TEST(reactor_event_notifier, node_status)
{
	std::vector<message_container> messages;
	reactor_event_notifier notifier(
		[&messages](const message_container &msg) { messages.push_back(msg); }, broker_connect::KEY_EVENT_NOTIFIER);

	notifier.node_online("696431", "alpha");
	notifier.node_offline("696431", "alpha");

	EXPECT_THAT(messages,
		ElementsAre(message_container(broker_connect::KEY_EVENT_NOTIFIER,
						"",
						{"type", "node-status", "id", "696431", "status", "online", "name", "alpha"}),
			message_container(broker_connect::KEY_EVENT_NOTIFIER,
				"",
				{"type", "node-status", "id", "696431", "status", "offline", "name", "alpha"})));
}

TEST(reactor_event_notifier, task_status)
{
	std::vector<message_container> messages;
	reactor_event_notifier notifier(
		[&messages](const message_container &msg) { messages.push_back(msg); }, broker_connect::KEY_EVENT_NOTIFIER);

	notifier.task_status("t1", "COMPLETED");
	notifier.task_status("t2", "FAILED", "crashed");
	notifier.error("out of memory");

	EXPECT_THAT(messages,
		ElementsAre(message_container(broker_connect::KEY_EVENT_NOTIFIER,
						"",
						{"type", "task-status", "id", "t1", "status", "COMPLETED"}),
			message_container(broker_connect::KEY_EVENT_NOTIFIER,
				"",
				{"type", "task-status", "id", "t2", "status", "FAILED", "message", "crashed"}),
			message_container(broker_connect::KEY_EVENT_NOTIFIER, "", {"type", "error", "message", "out of memory"})));
}

TEST(event_notifier_handler, build_request)
{
	notifier_config config;
	config.address = "http://hooks.local/events";
	event_notifier_handler handler(config, nullptr);

	auto request = handler.build_request(message_container(broker_connect::KEY_EVENT_NOTIFIER,
		"",
		{"type", "node-status", "id", "696431", "status", "online", "name", "alpha"}));

	EXPECT_EQ("http://hooks.local/events/node-status/696431", request.url);
	EXPECT_THAT(request.params,
		UnorderedElementsAre(Pair("status", "online"), Pair("name", "alpha")));

	auto error = handler.build_request(
		message_container(broker_connect::KEY_EVENT_NOTIFIER, "", {"type", "error", "message", "boom"}));

	EXPECT_EQ("http://hooks.local/events/error", error.url);
	EXPECT_THAT(error.params, ElementsAre(Pair("message", "boom")));
}

TEST(event_notifier_handler, dangling_key_is_ignored)
{
	notifier_config config;
	config.address = "http://hooks.local";
	event_notifier_handler handler(config, nullptr);

	auto request = handler.build_request(
		message_container(broker_connect::KEY_EVENT_NOTIFIER, "", {"type", "task-status", "id", "t1", "status"}));

	EXPECT_EQ("http://hooks.local/task-status/t1", request.url);
	EXPECT_THAT(request.params, IsEmpty());
}

TEST(event_notifier_handler, disabled)
{
	notifier_config config;
	event_notifier_handler handler(config, nullptr, 1, std::chrono::milliseconds(1));
	std::vector<message_container> messages;

	ASSERT_FALSE(config.enabled());
	handler.on_request(message_container(broker_connect::KEY_EVENT_NOTIFIER, "", {"type", "error"}),
		[&messages](const message_container &msg) { messages.push_back(msg); });

	EXPECT_THAT(messages, IsEmpty());
}

TEST(event_notifier_handler, unreachable_endpoint_gives_up)
{
	notifier_config config;
	config.address = "http://127.0.0.1";
	config.port = 1;
	event_notifier_handler handler(config, nullptr, 2, std::chrono::milliseconds(1));
	std::vector<message_container> messages;

	ASSERT_NO_THROW(handler.on_request(
		message_container(broker_connect::KEY_EVENT_NOTIFIER, "", {"type", "error", "message", "x"}),
		[&messages](const message_container &msg) { messages.push_back(msg); }));

	EXPECT_THAT(messages, IsEmpty());
}
