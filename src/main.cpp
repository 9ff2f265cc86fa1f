#include "broker_core.h"
#include <iostream>
#include <string>
#include <vector>
#include <zmq.hpp>


int main(int argc, char **argv)
{
	std::vector<std::string> args(argv, argv + argc);
	try {
		broker_core core(args);
		core.run();
	} catch (zmq::error_t &e) {
		std::cerr << "Network error: " << e.what() << std::endl;
		return 1;
	} catch (std::exception &e) {
		std::cerr << "Broker failed: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
