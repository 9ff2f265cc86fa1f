#include "string_to_hex.h"

#include <stdexcept>

std::string helpers::string_to_hex(const std::string &string)
{
	std::stringstream ss;
	ss << std::hex << std::setfill('0') << std::nouppercase;
	for (auto &c : string) {
		ss << std::setw(2) << static_cast<unsigned int>(static_cast<unsigned char>(c));
	}
	return ss.str();
}

static int hex_digit_value(char c)
{
	if (c >= '0' && c <= '9') {
		return c - '0';
	} else if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	} else if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}

	return -1;
}

std::string helpers::hex_to_string(const std::string &hex)
{
	if (hex.size() % 2 != 0) {
		throw std::invalid_argument("Hexadecimal string has odd length");
	}

	std::string result;
	result.reserve(hex.size() / 2);

	for (std::size_t i = 0; i < hex.size(); i += 2) {
		int high = hex_digit_value(hex[i]);
		int low = hex_digit_value(hex[i + 1]);

		if (high < 0 || low < 0) {
			throw std::invalid_argument("Invalid hexadecimal character in '" + hex + "'");
		}

		result.push_back(static_cast<char>((high << 4) | low));
	}

	return result;
}
