#ifndef NODEHUB_BROKER_MEMORY_STORE_H
#define NODEHUB_BROKER_MEMORY_STORE_H

#include <deque>
#include <map>
#include <mutex>

#include "store_interface.h"


/**
 * Store which lives only as long as the process.
 */
class memory_store : public store_interface
{
public:
	memory_store() = default;
	~memory_store() override = default;

	void append(const std::string &key, const std::string &value) override;
	std::vector<std::string> read_all(const std::string &key, bool clear = false) override;
	void trim(const std::string &key, std::size_t keep_last) override;
	std::vector<std::string> keys(const std::string &prefix) override;

private:
	std::mutex mutex_;
	std::map<std::string, std::deque<std::string>> lists_;
};

#endif // NODEHUB_BROKER_MEMORY_STORE_H
