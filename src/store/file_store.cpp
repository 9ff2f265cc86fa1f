#include "file_store.h"
#include "../helpers/string_to_hex.h"

#include <algorithm>
#include <boost/filesystem/fstream.hpp>

namespace fs = boost::filesystem;

const std::string file_store::EXTENSION = ".list";


file_store::file_store(const fs::path &directory) : directory_(directory)
{
	try {
		fs::create_directories(directory_);
	} catch (fs::filesystem_error &e) {
		throw store_error("Store directory " + directory_.string() + " cannot be created: " + e.what());
	}

	if (!fs::is_directory(directory_)) {
		throw store_error("Store path " + directory_.string() + " is not a directory");
	}
}

fs::path file_store::file_of(const std::string &key) const
{
	return directory_ / (helpers::string_to_hex(key) + EXTENSION);
}

std::vector<std::string> file_store::read_lines(const fs::path &file) const
{
	std::vector<std::string> result;
	if (!fs::exists(file)) {
		return result;
	}

	fs::ifstream input(file);
	if (!input) {
		throw store_error("Cannot open " + file.string() + " for reading");
	}

	std::string line;
	while (std::getline(input, line)) {
		if (!line.empty()) {
			result.push_back(line);
		}
	}

	if (input.bad()) {
		throw store_error("Cannot read " + file.string());
	}
	return result;
}

void file_store::append(const std::string &key, const std::string &value)
{
	if (value.find('\n') != std::string::npos) {
		throw store_error("Stored values must be single line");
	}

	std::lock_guard<std::mutex> lock(mutex_);

	fs::path file = file_of(key);
	fs::ofstream output(file, std::ios::app);
	output << value << '\n';
	output.flush();

	if (!output) {
		throw store_error("Cannot write to " + file.string());
	}
}

std::vector<std::string> file_store::read_all(const std::string &key, bool clear)
{
	std::lock_guard<std::mutex> lock(mutex_);

	fs::path file = file_of(key);
	std::vector<std::string> result = read_lines(file);

	if (clear) {
		boost::system::error_code error;
		fs::remove(file, error);
		if (error) {
			throw store_error("Cannot remove " + file.string() + ": " + error.message());
		}
	}

	return result;
}

void file_store::trim(const std::string &key, std::size_t keep_last)
{
	std::lock_guard<std::mutex> lock(mutex_);

	fs::path file = file_of(key);
	std::vector<std::string> lines = read_lines(file);
	if (lines.size() <= keep_last) {
		return;
	}

	// survivors replace the list by rename
	fs::path temporary = file;
	temporary += ".tmp";
	{
		fs::ofstream output(temporary, std::ios::trunc);
		for (auto it = lines.end() - keep_last; it != lines.end(); ++it) {
			output << *it << '\n';
		}
		output.flush();

		if (!output) {
			throw store_error("Cannot write to " + temporary.string());
		}
	}

	boost::system::error_code error;
	fs::rename(temporary, file, error);
	if (error) {
		throw store_error("Cannot replace " + file.string() + ": " + error.message());
	}
}

std::vector<std::string> file_store::keys(const std::string &prefix)
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<std::string> result;
	try {
		for (fs::directory_iterator it(directory_), end; it != end; ++it) {
			fs::path file = it->path();
			if (!fs::is_regular_file(file) || file.extension().string() != EXTENSION) {
				continue;
			}

			std::string key;
			try {
				key = helpers::hex_to_string(file.stem().string());
			} catch (std::invalid_argument &) {
				// not one of our files
				continue;
			}

			if (key.compare(0, prefix.size(), prefix) == 0 && fs::file_size(file) > 0) {
				result.push_back(key);
			}
		}
	} catch (fs::filesystem_error &e) {
		throw store_error("Cannot list store directory: " + std::string(e.what()));
	}

	std::sort(result.begin(), result.end());
	return result;
}
