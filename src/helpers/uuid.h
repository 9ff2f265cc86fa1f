#ifndef NODEHUB_BROKER_HELPERS_UUID_H
#define NODEHUB_BROKER_HELPERS_UUID_H

#include <string>

namespace helpers
{
	/**
	 * Generate a random (version 4) UUID in its canonical textual form.
	 * Used for message and task identifiers. Safe to call from any thread.
	 * @return new identifier, e.g. "1b4e28ba-2fa1-11d2-883f-0016d3cca427"
	 */
	std::string generate_uuid();
} // namespace helpers

#endif // NODEHUB_BROKER_HELPERS_UUID_H
