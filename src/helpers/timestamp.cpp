#include "timestamp.h"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string helpers::format_timestamp(const std::chrono::system_clock::time_point &time)
{
	using namespace std::chrono;

	auto millis = duration_cast<milliseconds>(time.time_since_epoch()) % 1000;
	std::time_t seconds = system_clock::to_time_t(time);
	std::tm utc;
	gmtime_r(&seconds, &utc);

	std::stringstream ss;
	ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis.count()
	   << 'Z';
	return ss.str();
}

std::string helpers::timestamp_now()
{
	return format_timestamp(std::chrono::system_clock::now());
}
