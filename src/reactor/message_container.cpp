#include "message_container.h"


message_container::message_container(
	const std::string &key, const std::string &identity, const std::vector<std::string> &data)
	: key(key), identity(identity), data(data)
{
}

const std::string &message_container::get_frame(std::size_t index) const
{
	static const std::string empty;
	return index < data.size() ? data[index] : empty;
}

bool message_container::operator==(const message_container &other) const
{
	return key == other.key && identity == other.identity && data == other.data;
}
