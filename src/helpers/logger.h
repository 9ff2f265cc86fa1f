#ifndef NODEHUB_BROKER_HELPERS_LOGGER_H
#define NODEHUB_BROKER_HELPERS_LOGGER_H

#include <memory>
#include <string>

// clang-format off
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
// clang-format on

namespace helpers
{
	/**
	 * Creates a logger which throws away everything written into it.
	 * Components use it when no logger was given to them.
	 * @return smart pointer to created logger
	 */
	std::shared_ptr<spdlog::logger> create_null_logger();

	/**
	 * Translate textual description of a logging level to spdlog::level enumeration.
	 * Unknown names fall back to trace.
	 * @param lev textual description of logging level (off, critical, err, warn, info, debug, trace)
	 * @return enumeration item suitable to textual description
	 */
	spdlog::level::level_enum get_log_level(const std::string &lev);
} // namespace helpers


#endif // NODEHUB_BROKER_HELPERS_LOGGER_H
