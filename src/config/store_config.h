#ifndef NODEHUB_BROKER_STORE_CONFIG_H
#define NODEHUB_BROKER_STORE_CONFIG_H

#include <string>


/**
 * Backend which keeps the offline queues and the audit trail.
 */
struct store_config {
public:
	/**
	 * Either "memory" (lost on restart) or "file".
	 */
	std::string type = "memory";
	/**
	 * Directory of the file store.
	 */
	std::string path = "/var/lib/nodehub/store";

	bool operator==(const store_config &second) const
	{
		return type == second.type && path == second.path;
	}
};

#endif // NODEHUB_BROKER_STORE_CONFIG_H
