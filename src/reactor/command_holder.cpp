#include "command_holder.h"

bool command_holder::call_function(const std::string &command,
	const std::string &identity,
	const std::vector<std::string> &message,
	const handler_interface::response_cb &respond) const
{
	auto it = functions_.find(command);
	if (it == functions_.end()) {
		return false;
	}

	(it->second)(identity, message, respond);
	return true;
}

bool command_holder::register_command(const std::string &command, command_holder::callback_fn callback)
{
	return functions_.emplace(command, std::move(callback)).second;
}
