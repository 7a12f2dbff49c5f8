#ifndef SALVO_VIEWER_BATTLE_VIEWER_H
#define SALVO_VIEWER_BATTLE_VIEWER_H

#include "salvo/battle.h"
#include "salvo/battle_log.h"
#include "salvo/game.h"
#include "salvo/messages.h"
#include <SDL3/SDL.h>
#include <array>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// Macro for instantiating std::unique_ptr with default deleters
template <typename T>
class Wrapped : public std::unique_ptr<T, void (*)(T*)> {};
#define WRAPPED(type, deleter)                                                 \
	template <>                                                                \
	class Wrapped<type> : public std::unique_ptr<type, void (*)(type*)> {      \
		public:                                                                \
		Wrapped(type* p)                                                       \
			: std::unique_ptr<type, void (*)(type*)>{p, deleter} {             \
			if (p == nullptr)                                                  \
				throw std::runtime_error{SDL_GetError()};                      \
		}                                                                      \
		operator type*() { return get(); }                                     \
	};
WRAPPED(SDL_Window, SDL_DestroyWindow);
WRAPPED(SDL_Renderer, SDL_DestroyRenderer);

constexpr size_t margin{6}, size{24}, hitmargin{4};

/* first three records of a battle file: start and both fleets */
struct RecordHeader {
	Salvo::Messages::Start start;
	std::array<Salvo::Messages::Grid, 2> grids;

	RecordHeader(Salvo::RecordReader& reader) {
		Salvo::Messages::Wire w;
		if (!reader.next(w) || !w.has_start()) {
			throw std::runtime_error{"Record does not begin with a battle start"};
		}
		start = w.start();
		for (auto& g : grids) {
			if (!reader.next(w) || !w.has_grid()) {
				throw std::runtime_error{"Record is missing a fleet"};
			}
			auto side{w.grid().side()};
			if ((side != 1) && (side != 2)) {
				throw std::runtime_error{"Fleet of unknown side " +
										 std::to_string(side)};
			}
			g = w.grid();
		}
		if (grids[0].side() == grids[1].side()) {
			throw std::runtime_error{"Record holds the same fleet twice"};
		}
		if (grids[0].side() == 2) {
			std::swap(grids[0], grids[1]);
		}
	}
};

class Viewer {
	class SDLguard {
		public:
		SDLguard() {
			if (!SDL_Init(SDL_INIT_VIDEO)) {
				throw std::runtime_error{SDL_GetError()};
			}
		}
		~SDLguard() { SDL_Quit(); }
	} sdlguard;
	Salvo::RecordReader reader;
	RecordHeader header;
	Uint64 delay;
	std::array<Salvo::Grid, 2> boards;
	std::array<std::vector<Salvo::ShipInstance>, 2> ships;
	// cells attacked on each side's board
	std::array<std::unordered_set<Salvo::Point>, 2> attacked;
	Wrapped<SDL_Window> window;
	Wrapped<SDL_Renderer> renderer;
	std::vector<SDL_FRect> squares, ship_cells, hits, sunk, misses;
	bool finished{false};

	float board_offset(size_t side) const {
		return static_cast<float>(side * (header.start.cols() * (size + margin) + margin));
	}

	void collect() {
		ship_cells.clear();
		hits.clear();
		sunk.clear();
		misses.clear();
		for (size_t side = 0; side < 2; side++) {
			auto g{Salvo::display_grid(boards[side], ships[side], attacked[side])};
			for (size_t y = 0; y < g.rows(); y++) {
				for (size_t x = 0; x < g.cols(); x++) {
					SDL_FRect square{
						static_cast<float>((size + margin) * x + margin) +
							board_offset(side),
						static_cast<float>((size + margin) * y + margin), size,
						size};
					auto tag{g.at({x, y})};
					if (tag == Salvo::HIT) {
						hits.push_back(square);
					} else if (tag == Salvo::SUNK) {
						sunk.push_back(square);
					} else if (tag == Salvo::MISS) {
						misses.push_back(square);
					} else if (tag != Salvo::EMPTY) {
						square.x += hitmargin;
						square.y += hitmargin;
						square.w -= 2 * hitmargin;
						square.h -= 2 * hitmargin;
						ship_cells.push_back(square);
					}
				}
			}
		}
	}

	void render() {
		collect();
		SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
		SDL_RenderClear(renderer);
		SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
		SDL_RenderFillRects(renderer, squares.data(), squares.size());
		SDL_SetRenderDrawColor(renderer, 128, 128, 0, 255);
		SDL_RenderFillRects(renderer, ship_cells.data(), ship_cells.size());
		SDL_SetRenderDrawColor(renderer, 0, 255, 0, 255);
		SDL_RenderFillRects(renderer, hits.data(), hits.size());
		SDL_SetRenderDrawColor(renderer, 0, 100, 0, 255);
		SDL_RenderFillRects(renderer, sunk.data(), sunk.size());
		SDL_SetRenderDrawColor(renderer, 255, 0, 0, 255);
		SDL_RenderFillRects(renderer, misses.data(), misses.size());
		SDL_RenderPresent(renderer);
	}

	/* applies the next record; false once the battle is over */
	bool advance() {
		Salvo::Messages::Wire w;
		if (!reader.next(w)) {
			SDL_SetWindowTitle(window, "Battle record ended without a result");
			return false;
		}
		if (w.has_move()) {
			auto m{Salvo::move_from_pb_obj(w.move())};
			if ((m.side != 1) && (m.side != 2)) {
				throw std::runtime_error{"Move by unknown side " +
										 std::to_string(m.side)};
			}
			size_t defender{(m.side == 1) ? 1u : 0u};
			if (!boards[defender].contains(m.target)) {
				throw std::runtime_error{"Move outside the board: " +
										 Salvo::describe(m)};
			}
			attacked[defender].insert(m.target);
			Salvo::resolve_attack(m.target, ships[defender]);
			SDL_SetWindowTitle(window, Salvo::describe(m).c_str());
			return true;
		}
		if (w.has_result()) {
			Salvo::BattleSummary s{static_cast<int>(w.result().winner()),
				w.result().moves()};
			SDL_SetWindowTitle(window, Salvo::describe(s).c_str());
			return false;
		}
		std::cerr << "Warning: skipping unexpected record" << std::endl;
		return true;
	}

	public:
	Viewer(const std::string& path, Uint64 delay_ms)
		: reader{path}, header{reader}, delay{delay_ms},
		  boards{Salvo::grid_from_pb_obj(header.grids[0]),
			  Salvo::grid_from_pb_obj(header.grids[1])},
		  ships{Salvo::ships_from_pb_obj(header.grids[0]),
			  Salvo::ships_from_pb_obj(header.grids[1])},
		  window{SDL_CreateWindow("Battle",
			  ((size + margin) * header.start.cols() + margin) * 2,
			  (size + margin) * header.start.rows() + margin, 0)},
		  renderer{SDL_CreateRenderer(window, NULL)} {
		for (size_t side = 0; side < 2; side++) {
			for (size_t x = 0; x < header.start.cols(); x++) {
				for (size_t y = 0; y < header.start.rows(); y++) {
					squares.push_back(SDL_FRect{
						static_cast<float>((size + margin) * x + margin) +
							board_offset(side),
						static_cast<float>((size + margin) * y + margin), size,
						size});
				}
			}
		}
	}

	int run() {
		SDL_SetRenderVSync(renderer, SDL_RENDERER_VSYNC_ADAPTIVE);
		auto last{SDL_GetTicks()};
		render();
		while (true) {
			SDL_Event e{};
			while (SDL_PollEvent(&e)) {
				if (e.type == SDL_EVENT_QUIT) {
					return 0;
				}
			}
			if (!finished && (SDL_GetTicks() - last >= delay)) {
				last = SDL_GetTicks();
				finished = !advance();
				render();
			}
			SDL_Delay(10);
		}
	}
};

#endif
