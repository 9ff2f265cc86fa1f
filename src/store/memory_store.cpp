#include "memory_store.h"


void memory_store::append(const std::string &key, const std::string &value)
{
	std::lock_guard<std::mutex> lock(mutex_);
	lists_[key].push_back(value);
}

std::vector<std::string> memory_store::read_all(const std::string &key, bool clear)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = lists_.find(key);
	if (it == lists_.end()) {
		return {};
	}

	std::vector<std::string> result(it->second.begin(), it->second.end());
	if (clear) {
		lists_.erase(it);
	}
	return result;
}

void memory_store::trim(const std::string &key, std::size_t keep_last)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = lists_.find(key);
	if (it == lists_.end()) {
		return;
	}

	while (it->second.size() > keep_last) {
		it->second.pop_front();
	}
	if (it->second.empty()) {
		lists_.erase(it);
	}
}

std::vector<std::string> memory_store::keys(const std::string &prefix)
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<std::string> result;
	for (auto it = lists_.lower_bound(prefix); it != lists_.end(); ++it) {
		if (it->first.compare(0, prefix.size(), prefix) != 0) {
			break;
		}
		if (!it->second.empty()) {
			result.push_back(it->first);
		}
	}
	return result;
}
