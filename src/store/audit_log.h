#ifndef NODEHUB_BROKER_AUDIT_LOG_H
#define NODEHUB_BROKER_AUDIT_LOG_H

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>

#include "../helpers/logger.h"
#include "../message.h"
#include "store_interface.h"


/**
 * Bounded trail of every routed message.
 * Failures of the store are logged and never propagate to routing.
 */
class audit_log
{
public:
	/** Store key of the trail */
	static const std::string KEY;

	/**
	 * @param store backend
	 * @param max_entries number of newest entries which survive trimming
	 * @param logger optional logger
	 */
	audit_log(std::shared_ptr<store_interface> store,
		std::size_t max_entries,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	virtual ~audit_log() = default;

	/**
	 * Append a message to the trail.
	 */
	virtual void record(const message &msg);

	/**
	 * Newest entries, most recent first.
	 * @param count maximal number of entries
	 */
	virtual std::vector<nlohmann::json> recent(std::size_t count) const;

	/**
	 * Number of messages recorded since start.
	 */
	std::size_t get_recorded_count() const;

private:
	std::shared_ptr<store_interface> store_;
	std::size_t max_entries_;
	std::shared_ptr<spdlog::logger> logger_;

	mutable std::mutex mutex_;
	std::size_t recorded_ = 0;
	/** Appends since the last trim, trimming happens once per max_entries appends */
	std::size_t since_trim_ = 0;
};

#endif // NODEHUB_BROKER_AUDIT_LOG_H
