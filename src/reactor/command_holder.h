#ifndef NODEHUB_BROKER_COMMAND_HOLDER_H
#define NODEHUB_BROKER_COMMAND_HOLDER_H

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "handler_interface.h"


/**
 * Maps command names (first frame of a request) to callbacks.
 *
 * A callback receives the identity of the peer, all frames of the request (the command included)
 * and the response callback of the handler which owns the holder.
 */
class command_holder
{
public:
	/** Type of callback function for easier use. */
	typedef std::function<void(
		const std::string &, const std::vector<std::string> &, const handler_interface::response_cb &)>
		callback_fn;

	/**
	 * Invoke registered callback for given command (if any).
	 * @param command name of the command
	 * @param identity peer which sent the request
	 * @param message all frames of the request
	 * @param respond a callback to let the handler respond
	 * @return @a false if no callback is registered for the command
	 */
	bool call_function(const std::string &command,
		const std::string &identity,
		const std::vector<std::string> &message,
		const handler_interface::response_cb &respond) const;

	/**
	 * Register new command with a callback.
	 * @param command name of the command
	 * @param callback function to call when this command occurs
	 * @return @a true if add successful, @a false if the command was already registered
	 */
	bool register_command(const std::string &command, callback_fn callback);

private:
	std::map<std::string, callback_fn> functions_;
};

#endif // NODEHUB_BROKER_COMMAND_HOLDER_H
