#include "battle_viewer.h"
#include <SDL3/SDL.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
	if ((argc < 2) || (argc > 3)) {
		std::cerr << "usage: salvo_viewer BATTLE_RECORD [DELAY_MS]" << std::endl;
		return EXIT_FAILURE;
	}
	try {
		Viewer viewer{argv[1], (argc == 3) ? std::stoull(argv[2]) : 100};
		return viewer.run();
	} catch (std::exception& e) {
		SDL_ShowSimpleMessageBox(
			SDL_MESSAGEBOX_ERROR, "Battle viewer", e.what(), nullptr);
		std::cerr << "Viewer exited with the following error:\n";
		std::cerr << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
