#ifndef NODEHUB_BROKER_HELPERS_TIMESTAMP_H
#define NODEHUB_BROKER_HELPERS_TIMESTAMP_H

#include <chrono>
#include <string>

namespace helpers
{
	/**
	 * Format a point in time as an ISO-8601 UTC timestamp with millisecond precision.
	 * @param time point in time
	 * @return e.g. "2024-03-01T12:30:00.125Z"
	 */
	std::string format_timestamp(const std::chrono::system_clock::time_point &time);

	/**
	 * Shorthand for @ref format_timestamp of the current time.
	 */
	std::string timestamp_now();
} // namespace helpers

#endif // NODEHUB_BROKER_HELPERS_TIMESTAMP_H
