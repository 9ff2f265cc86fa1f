#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <set>

#include "../src/helpers/curl.h"
#include "../src/helpers/logger.h"
#include "../src/helpers/string_to_hex.h"
#include "../src/helpers/timestamp.h"
#include "../src/helpers/uuid.h"

using namespace testing;

TEST(helpers, string_to_hex)
{
	ASSERT_EQ("696431", helpers::string_to_hex("id1"));
	ASSERT_EQ("", helpers::string_to_hex(""));
	// bytes above 0x7f are not sign extended
	ASSERT_EQ("00ff80", helpers::string_to_hex(std::string("\x00\xff\x80", 3)));
}

TEST(helpers, hex_to_string)
{
	ASSERT_EQ("id1", helpers::hex_to_string("696431"));
	ASSERT_EQ(std::string("\x00\xff\x80", 3), helpers::hex_to_string("00FF80"));
	ASSERT_EQ("queue:node", helpers::hex_to_string(helpers::string_to_hex("queue:node")));
}

TEST(helpers, hex_to_string_invalid)
{
	ASSERT_THROW(helpers::hex_to_string("abc"), std::invalid_argument);
	ASSERT_THROW(helpers::hex_to_string("zz"), std::invalid_argument);
}

TEST(helpers, format_timestamp)
{
	std::chrono::system_clock::time_point epoch;
	ASSERT_EQ("1970-01-01T00:00:00.000Z", helpers::format_timestamp(epoch));
	ASSERT_EQ("1970-01-01T00:00:01.500Z", helpers::format_timestamp(epoch + std::chrono::milliseconds(1500)));
	ASSERT_EQ("1970-01-02T00:00:00.007Z",
		helpers::format_timestamp(epoch + std::chrono::hours(24) + std::chrono::milliseconds(7)));
}

TEST(helpers, timestamp_now)
{
	auto now = helpers::timestamp_now();
	ASSERT_EQ(24u, now.size());
	ASSERT_EQ('T', now[10]);
	ASSERT_EQ('Z', now.back());
}

TEST(helpers, generate_uuid)
{
	std::set<std::string> ids;
	for (int i = 0; i < 100; ++i) {
		auto id = helpers::generate_uuid();
		ASSERT_EQ(36u, id.size());
		ids.insert(id);
	}
	ASSERT_EQ(100u, ids.size());
}

TEST(helpers, get_log_level)
{
	ASSERT_EQ(spdlog::level::off, helpers::get_log_level("off"));
	ASSERT_EQ(spdlog::level::critical, helpers::get_log_level("emerg"));
	ASSERT_EQ(spdlog::level::err, helpers::get_log_level("err"));
	ASSERT_EQ(spdlog::level::warn, helpers::get_log_level("warning"));
	ASSERT_EQ(spdlog::level::info, helpers::get_log_level("notice"));
	ASSERT_EQ(spdlog::level::debug, helpers::get_log_level("debug"));
	ASSERT_EQ(spdlog::level::trace, helpers::get_log_level("anything"));
}

TEST(helpers, http_query)
{
	helpers::curl_params params = {{"status", "online"}, {"name", "worker 1&2"}};
	ASSERT_EQ("name=worker%201%262&status=online", helpers::get_http_query(params));
	ASSERT_EQ("", helpers::get_http_query({}));
}
