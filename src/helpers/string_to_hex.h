#ifndef NODEHUB_BROKER_STRING_TO_HEX_H
#define NODEHUB_BROKER_STRING_TO_HEX_H

#include <iomanip>
#include <sstream>
#include <string>

namespace helpers
{
	/**
	 * Converts all characters to their hexadecimal representation and returns them concatenated.
	 * Used to turn binary ZeroMQ routing identities into printable node identifiers.
	 * @param string text which will be converted to its hexadecimal representation
	 * @return lowercase hexadecimal digits, two per input byte
	 */
	std::string string_to_hex(const std::string &string);

	/**
	 * Inverse of @ref string_to_hex.
	 * @param hex lowercase or uppercase hexadecimal digits
	 * @return decoded bytes
	 * @throws std::invalid_argument if the input has odd length or contains a non-hex character
	 */
	std::string hex_to_string(const std::string &hex);
} // namespace helpers


#endif // NODEHUB_BROKER_STRING_TO_HEX_H
