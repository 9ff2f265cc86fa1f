#include "connection_registry.h"
#include "helpers/string_to_hex.h"


connection_registry::connection_registry(
	std::shared_ptr<capability_index> index, registration_policy policy, std::size_t max_liveness)
	: index_(index), policy_(policy), max_liveness_(max_liveness)
{
	if (index_ == nullptr) {
		index_ = std::make_shared<capability_index>();
	}
}

registration_result connection_registry::register_node(const std::string &identity, const registration_info &info)
{
	auto candidate = std::make_shared<node>(identity, info, max_liveness_);

	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_.find(candidate->id);
	if (it == nodes_.end()) {
		nodes_.emplace(candidate->id, candidate);
		index_->advertise(candidate->id, candidate->capabilities);
		return {candidate, true, false};
	}

	node_ptr existing = it->second;
	if (policy_ == registration_policy::reject) {
		return {existing, false, false};
	}

	existing->type = candidate->type;
	existing->name = candidate->name;
	existing->capabilities = candidate->capabilities;
	existing->last_seen = candidate->last_seen;
	existing->liveness = max_liveness_;
	index_->advertise(existing->id, existing->capabilities);

	return {existing, true, true};
}

bool connection_registry::update_capabilities(const std::string &node_id, const std::set<std::string> &capabilities)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_.find(node_id);
	if (it == nodes_.end()) {
		return false;
	}

	it->second->capabilities = capabilities;
	index_->advertise(node_id, capabilities);
	return true;
}

node_ptr connection_registry::lookup(const std::string &node_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_.find(node_id);
	return it == nodes_.end() ? nullptr : it->second;
}

node_ptr connection_registry::find_by_identity(const std::string &identity) const
{
	return lookup(helpers::string_to_hex(identity));
}

node_ptr connection_registry::evict(const std::string &node_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_.find(node_id);
	if (it == nodes_.end()) {
		return nullptr;
	}

	node_ptr removed = it->second;
	nodes_.erase(it);
	index_->remove(node_id);

	return removed;
}

bool connection_registry::touch(const std::string &node_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_.find(node_id);
	if (it == nodes_.end()) {
		return false;
	}

	it->second->last_seen = std::chrono::system_clock::now();
	it->second->liveness = max_liveness_;
	return true;
}

std::size_t connection_registry::decrease_liveness(const std::string &node_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = nodes_.find(node_id);
	if (it == nodes_.end()) {
		return 0;
	}

	if (it->second->liveness > 0) {
		it->second->liveness -= 1;
	}
	return it->second->liveness;
}

std::vector<node_ptr> connection_registry::get_nodes() const
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<node_ptr> result;
	result.reserve(nodes_.size());
	for (auto &item : nodes_) {
		result.push_back(item.second);
	}
	return result;
}

std::size_t connection_registry::size() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return nodes_.size();
}
