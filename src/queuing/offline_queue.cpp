#include "offline_queue.h"
#include "../protocol.h"

const std::string offline_queue::KEY_PREFIX = "queue:";


offline_queue::offline_queue(std::shared_ptr<store_interface> store, std::shared_ptr<spdlog::logger> logger)
	: store_(store), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

void offline_queue::enqueue(const std::string &node_id, message_ptr msg)
{
	std::lock_guard<std::mutex> lock(mutex_);
	queues_[node_id].push_back(msg);

	try {
		store_->append(KEY_PREFIX + node_id, msg->to_json().dump());
	} catch (store_error &e) {
		logger_->error("Queued message {} for {} was not persisted: {}", msg->id, node_id, e.what());
	}
}

std::vector<message_ptr> offline_queue::peek(const std::string &node_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = queues_.find(node_id);
	if (it == queues_.end()) {
		return {};
	}
	return std::vector<message_ptr>(it->second.begin(), it->second.end());
}

std::vector<message_ptr> offline_queue::drain(const std::string &node_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = queues_.find(node_id);
	if (it == queues_.end()) {
		return {};
	}

	std::vector<message_ptr> result(it->second.begin(), it->second.end());
	queues_.erase(it);
	clear_stored(node_id);

	return result;
}

std::size_t offline_queue::purge(const std::string &node_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = queues_.find(node_id);
	if (it == queues_.end()) {
		return 0;
	}

	std::size_t count = it->second.size();
	queues_.erase(it);
	clear_stored(node_id);

	return count;
}

void offline_queue::clear_stored(const std::string &node_id)
{
	try {
		store_->read_all(KEY_PREFIX + node_id, true);
	} catch (store_error &e) {
		logger_->error("Stored queue of {} was not cleared: {}", node_id, e.what());
	}
}

std::size_t offline_queue::get_queued_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::size_t count = 0;
	for (auto &queue : queues_) {
		count += queue.second.size();
	}
	return count;
}

std::size_t offline_queue::get_queued_count(const std::string &node_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = queues_.find(node_id);
	return it == queues_.end() ? 0 : it->second.size();
}

std::size_t offline_queue::restore()
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::size_t restored = 0;

	try {
		for (auto &key : store_->keys(KEY_PREFIX)) {
			std::string node_id = key.substr(KEY_PREFIX.size());
			auto &queue = queues_[node_id];
			queue.clear();

			for (auto &value : store_->read_all(key)) {
				try {
					queue.push_back(std::make_shared<const message>(message::from_json(nlohmann::json::parse(value))));
					++restored;
				} catch (nlohmann::json::exception &e) {
					logger_->warn("Corrupted queued message of {} skipped: {}", node_id, e.what());
				} catch (protocol_error &e) {
					logger_->warn("Corrupted queued message of {} skipped: {}", node_id, e.what());
				}
			}

			if (queue.empty()) {
				queues_.erase(node_id);
			}
		}
	} catch (store_error &e) {
		logger_->error("Offline queues were not restored: {}", e.what());
	}

	return restored;
}
