#ifndef NODEHUB_BROKER_NOTIFIER_CONFIG_H
#define NODEHUB_BROKER_NOTIFIER_CONFIG_H

#include <cstdint>
#include <string>


/**
 * Location of the HTTP webhook which receives presence and task lifecycle events.
 * Notifications are disabled while the address is empty.
 */
struct notifier_config {
public:
	/**
	 * Base url of the webhook, e.g. "http://localhost/events".
	 */
	std::string address;
	/**
	 * Port on which the webhook runs.
	 */
	std::uint16_t port = 80;
	/**
	 * Username which is used in HTTP authentication.
	 */
	std::string username;
	/**
	 * Password for HTTP authentication.
	 */
	std::string password;

	bool enabled() const
	{
		return !address.empty();
	}
};

#endif // NODEHUB_BROKER_NOTIFIER_CONFIG_H
