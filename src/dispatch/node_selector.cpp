#include "node_selector.h"


random_node_selector::random_node_selector() : engine_(std::random_device{}())
{
}

std::string random_node_selector::select(const std::vector<std::string> &candidates)
{
	if (candidates.empty()) {
		return "";
	}

	std::lock_guard<std::mutex> lock(mutex_);
	std::uniform_int_distribution<std::size_t> distribution(0, candidates.size() - 1);
	return candidates[distribution(engine_)];
}
