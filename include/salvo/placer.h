#ifndef SALVO_PLACER_H
#define SALVO_PLACER_H

#include "salvo/catalog.h"
#include "salvo/config.h"
#include "salvo/errors.h"
#include "salvo/game.h"
#include "salvo/player.h"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

namespace Salvo {

/* random number in range [0, ub) */
inline std::mt19937::result_type rrand(std::mt19937& r, uint32_t ub) {
	std::mt19937::result_type res{};
	do {
		res = r();
	} while (res >= (r.max() - r.max() % ub));
	return res % ub;
}

/* in bounds, on empty cells and not orthogonally touching another ship */
inline bool can_place(const Grid& g, const std::vector<Point>& cells) {
	for (const auto& p : cells) {
		if (!g.contains(p) || (g.at(p) != EMPTY)) {
			return false;
		}
		for (const auto& n : g.neighbours(p)) {
			if (g.at(n) != EMPTY) {
				return false;
			}
		}
	}
	return true;
}

class Placer {
	Grid& board;
	std::mt19937& r;

	/* shape cells anchored at a, or nothing if some cell falls off the
	 * top or left edge */
	static bool anchor(Point a, const Shape& s, std::vector<Point>& out) {
		out.clear();
		for (auto [dx, dy] : s) {
			auto x{static_cast<long long>(a.x) + dx};
			auto y{static_cast<long long>(a.y) + dy};
			if ((x < 0) || (y < 0)) {
				return false;
			}
			out.push_back({static_cast<size_t>(x), static_cast<size_t>(y)});
		}
		return true;
	}

	bool try_place(const ShapeDefinition& def, const std::vector<Point>& starts) {
		const auto& shape{def.variants[rrand(r, def.variants.size())]};
		std::vector<Point> cells;
		for (const auto& a : starts) {
			for (int deg : {0, 90, 180, 270}) {
				if (anchor(a, rotate(shape, deg), cells) &&
					can_place(board, cells)) {
					for (const auto& p : cells) {
						board.set(p, def.ship_id);
					}
					return true;
				}
			}
		}
		return false;
	}

	public:
	Placer(Grid& g, std::mt19937& rng) : board{g}, r{rng} {}

	/* Fills the board, largest ships first. When some ship does not fit
	 * anywhere the whole board is cleared and placement starts over. */
	void place(const ShipCounts& counts) {
		auto required{required_tiles(counts)};
		if (required > board.area()) {
			throw InsufficientSpace{required, board.area()};
		}
		std::vector<const ShapeDefinition*> order;
		for (const auto& def : catalog) {
			order.push_back(&def);
		}
		std::stable_sort(order.begin(), order.end(),
			[](const ShapeDefinition* a, const ShapeDefinition* b) {
				return a->tile_count > b->tile_count;
			});
		std::vector<Point> starts;
		for (size_t x = 0; x < board.cols(); x++) {
			for (size_t y = 0; y < board.rows(); y++) {
				starts.push_back({x, y});
			}
		}
		for (size_t attempt = 0; attempt <= max_placement_restarts; attempt++) {
			board.clear();
			std::shuffle(starts.begin(), starts.end(), r);
			bool placed{true};
			for (const auto* def : order) {
				for (size_t i = 0; placed && (i < counts[def->ship_id - 1]); i++) {
					placed = try_place(*def, starts);
				}
				if (!placed) {
					break;
				}
			}
			if (placed) {
				return;
			}
#ifndef NDEBUG
			std::cerr << "Placement restart " << (attempt + 1) << std::endl;
#endif
		}
		board.clear();
		throw PlacementExhausted{max_placement_restarts};
	}
};

inline Grid place(size_t rows, size_t cols, const ShipCounts& counts,
	std::mt19937& rng) {
	Grid g{rows, cols};
	Placer{g, rng}.place(counts);
	return g;
}

/* default BoardSetup: random placement with its own generator */
class RandomBoardSetup : public BoardSetup {
	Grid board;
	ShipCounts counts;
	std::mt19937 r;

	public:
	RandomBoardSetup(size_t rows, size_t cols, const ShipCounts& c,
		uint32_t seed)
		: board{rows, cols}, counts{c}, r{seed} {}
	void place_ships() override { Placer{board, r}.place(counts); }
	Grid get_board() const override { return board; }
};

} // namespace Salvo

#endif
