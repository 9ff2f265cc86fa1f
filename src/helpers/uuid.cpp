#include "uuid.h"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

std::string helpers::generate_uuid()
{
	// the generator is not thread safe, every thread gets its own
	thread_local boost::uuids::random_generator generator;
	return boost::uuids::to_string(generator());
}
