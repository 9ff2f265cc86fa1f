#include "capability_index.h"


void capability_index::advertise(const std::string &node_id, const std::set<std::string> &capabilities)
{
	std::lock_guard<std::mutex> lock(mutex_);

	remove_locked(node_id);
	if (capabilities.empty()) {
		return;
	}

	for (auto &capability : capabilities) {
		nodes_by_capability_[capability].insert(node_id);
	}
	capabilities_by_node_[node_id] = capabilities;
}

capability_index::id_set capability_index::nodes_with(const std::string &capability) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_by_capability_.find(capability);
	if (it == nodes_by_capability_.end()) {
		return {};
	}
	return it->second;
}

void capability_index::remove(const std::string &node_id)
{
	std::lock_guard<std::mutex> lock(mutex_);
	remove_locked(node_id);
}

void capability_index::remove_locked(const std::string &node_id)
{
	auto node = capabilities_by_node_.find(node_id);
	if (node == capabilities_by_node_.end()) {
		return;
	}

	for (auto &capability : node->second) {
		auto entry = nodes_by_capability_.find(capability);
		if (entry == nodes_by_capability_.end()) {
			continue;
		}

		entry->second.erase(node_id);
		if (entry->second.empty()) {
			nodes_by_capability_.erase(entry);
		}
	}

	capabilities_by_node_.erase(node);
}

std::set<std::string> capability_index::capabilities_of(const std::string &node_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = capabilities_by_node_.find(node_id);
	if (it == capabilities_by_node_.end()) {
		return {};
	}
	return it->second;
}

std::map<std::string, capability_index::id_set> capability_index::get_capabilities() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return nodes_by_capability_;
}
