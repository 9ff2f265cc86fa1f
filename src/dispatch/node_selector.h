#ifndef NODEHUB_BROKER_NODE_SELECTOR_H
#define NODEHUB_BROKER_NODE_SELECTOR_H

#include <mutex>
#include <random>
#include <string>
#include <vector>


/**
 * Strategy choosing which of the capable nodes executes a task.
 */
class node_selector_interface
{
public:
	virtual ~node_selector_interface() = default;

	/**
	 * Choose one of the candidates.
	 * @param candidates ids of capable nodes, never empty, ordered by id
	 * @return id of the chosen node
	 */
	virtual std::string select(const std::vector<std::string> &candidates) = 0;
};


/**
 * Picks every candidate with the same probability.
 */
class random_node_selector : public node_selector_interface
{
public:
	random_node_selector();
	~random_node_selector() override = default;

	std::string select(const std::vector<std::string> &candidates) override;

private:
	std::mutex mutex_;
	std::mt19937 engine_;
};

#endif // NODEHUB_BROKER_NODE_SELECTOR_H
