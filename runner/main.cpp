#include "battle_runner.h"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
	try {
		Runner runner{argc, argv};
		return runner.run();
	} catch (const UsageError& e) {
		std::cerr << e.what() << std::endl;
		return EXIT_FAILURE;
	} catch (const std::exception& e) {
		std::cerr << "Battle runner exited with the following error:\n";
		std::cerr << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
