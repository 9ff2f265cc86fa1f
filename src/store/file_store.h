#ifndef NODEHUB_BROKER_FILE_STORE_H
#define NODEHUB_BROKER_FILE_STORE_H

#include <mutex>

#define BOOST_FILESYSTEM_NO_DEPRECATED
#include <boost/filesystem.hpp>

#include "store_interface.h"


/**
 * Store keeping every list in its own file under a directory, one value per line.
 * File names are hex encoded keys, so any key is a valid file name.
 * Values must not contain newlines (serialized JSON never does).
 */
class file_store : public store_interface
{
public:
	/**
	 * @param directory where the list files live, created if missing
	 * @throws store_error if the directory cannot be created
	 */
	explicit file_store(const boost::filesystem::path &directory);
	~file_store() override = default;

	void append(const std::string &key, const std::string &value) override;
	std::vector<std::string> read_all(const std::string &key, bool clear = false) override;
	void trim(const std::string &key, std::size_t keep_last) override;
	std::vector<std::string> keys(const std::string &prefix) override;

	/** Suffix of list files */
	static const std::string EXTENSION;

private:
	boost::filesystem::path file_of(const std::string &key) const;
	std::vector<std::string> read_lines(const boost::filesystem::path &file) const;

	boost::filesystem::path directory_;
	std::mutex mutex_;
};

#endif // NODEHUB_BROKER_FILE_STORE_H
