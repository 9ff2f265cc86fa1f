#include "logger.h"

std::shared_ptr<spdlog::logger> helpers::create_null_logger()
{
	// Create logger manually to avoid global registration of logger
	auto sink = std::make_shared<spdlog::sinks::null_sink_st>();
	auto logger = std::make_shared<spdlog::logger>("", sink);
	logger->set_level(spdlog::level::off);

	return logger;
}

spdlog::level::level_enum helpers::get_log_level(const std::string &lev)
{
	if (lev == "off") {
		return spdlog::level::off;
	} else if (lev == "critical" || lev == "emerg" || lev == "alert") {
		return spdlog::level::critical;
	} else if (lev == "err" || lev == "error") {
		return spdlog::level::err;
	} else if (lev == "warn" || lev == "warning") {
		return spdlog::level::warn;
	} else if (lev == "info" || lev == "notice") {
		return spdlog::level::info;
	} else if (lev == "debug") {
		return spdlog::level::debug;
	}

	return spdlog::level::trace;
}
