#include "audit_log.h"

#include <algorithm>

const std::string audit_log::KEY = "audit:messages";


audit_log::audit_log(
	std::shared_ptr<store_interface> store, std::size_t max_entries, std::shared_ptr<spdlog::logger> logger)
	: store_(store), max_entries_(max_entries), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

void audit_log::record(const message &msg)
{
	std::lock_guard<std::mutex> lock(mutex_);
	++recorded_;

	try {
		store_->append(KEY, msg.to_json().dump());

		if (++since_trim_ >= max_entries_) {
			store_->trim(KEY, max_entries_);
			since_trim_ = 0;
		}
	} catch (store_error &e) {
		logger_->error("Message {} was not written to the audit trail: {}", msg.id, e.what());
	}
}

std::vector<nlohmann::json> audit_log::recent(std::size_t count) const
{
	std::vector<std::string> entries;

	try {
		entries = store_->read_all(KEY);
	} catch (store_error &e) {
		logger_->error("Audit trail cannot be read: {}", e.what());
		return {};
	}

	// the bound may be exceeded until the next trim
	count = std::min(count, max_entries_);

	std::vector<nlohmann::json> result;
	for (auto it = entries.rbegin(); it != entries.rend() && result.size() < count; ++it) {
		try {
			result.push_back(nlohmann::json::parse(*it));
		} catch (nlohmann::json::parse_error &e) {
			logger_->warn("Corrupted audit entry skipped: {}", e.what());
		}
	}
	return result;
}

std::size_t audit_log::get_recorded_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return recorded_;
}
