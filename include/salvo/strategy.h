#ifndef SALVO_STRATEGY_H
#define SALVO_STRATEGY_H

#include "salvo/catalog.h"
#include "salvo/config.h"
#include "salvo/errors.h"
#include "salvo/game.h"
#include "salvo/player.h"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <utility>
#include <vector>

namespace Salvo {

/* Heatmap opponent. Every cell starts at probability 1.0; hits double the
 * probability of untried neighbours, sinking a ship clears the area around
 * it. Attacks go to the most probable untried cell, ties to cells with odd
 * x + y. */
class TargetingStrategy : public Strategy {
	size_t nrows, ncols;
	Grid view; // EMPTY = unknown, HIT or MISS
	std::vector<bool> attacked;
	std::vector<double> heat;
	ShipCounts remaining;

	bool tried(Point p) const { return attacked[p.y * ncols + p.x]; }
	double& heat_at(Point p) { return heat[p.y * ncols + p.x]; }

	std::vector<Point> hit_cluster(Point p) const {
		return flood_fill(nrows, ncols, p,
			[this](Point q) { return view.at(q) == HIT; });
	}

	void boost_neighbours(Point p) {
		for (const auto& n : view.neighbours(p)) {
			if (!tried(n)) {
				heat_at(n) *= hit_boost;
			}
		}
	}

	/* ships never touch, so nothing hides in the bounding box of a sunk
	 * ship grown by one cell */
	void clear_sunk_area(const std::vector<Point>& ship) {
		if (ship.empty()) {
			return;
		}
		auto [min_x, max_x] = std::minmax_element(ship.begin(), ship.end(),
			[](const Point& a, const Point& b) { return a.x < b.x; });
		auto [min_y, max_y] = std::minmax_element(ship.begin(), ship.end(),
			[](const Point& a, const Point& b) { return a.y < b.y; });
		size_t x0{(min_x->x > 0) ? min_x->x - 1 : 0};
		size_t y0{(min_y->y > 0) ? min_y->y - 1 : 0};
		size_t x1{std::min(ncols - 1, max_x->x + 1)};
		size_t y1{std::min(nrows - 1, max_y->y + 1)};
		for (size_t y = y0; y <= y1; y++) {
			for (size_t x = x0; x <= x1; x++) {
				if (!tried({x, y})) {
					heat_at({x, y}) = 0.0;
				}
			}
		}
	}

	/* Guesses which id was sunk: same size and family first, then size
	 * alone. Ids of equal size can be mixed up. */
	void update_ship_count(const std::vector<Point>& ship) {
		auto family{classify(ship)};
		for (bool match_family : {true, false}) {
			for (const auto& def : catalog) {
				auto& left{remaining[def.ship_id - 1]};
				if ((left == 0) || (def.tile_count != ship.size()) ||
					(match_family && (def.family != family))) {
					continue;
				}
				left--;
				return;
			}
		}
#ifndef NDEBUG
		std::cerr << "Sunk ship of size " << ship.size() << " ("
				  << family_name(family) << ") matches no remaining ship"
				  << std::endl;
#endif
	}

	public:
	TargetingStrategy(size_t rows, size_t cols, const ShipCounts& counts)
		: nrows{rows}, ncols{cols}, view{rows, cols},
		  attacked(rows * cols, false), heat(rows * cols, 1.0),
		  remaining{counts} {}

	Point get_next_attack() override {
		double best{-1.0};
		std::vector<Point> candidates;
		for (size_t y = 0; y < nrows; y++) {
			for (size_t x = 0; x < ncols; x++) {
				if (tried({x, y})) {
					continue;
				}
				auto h{heat[y * ncols + x]};
				if (h > best) {
					best = h;
					candidates.clear();
					candidates.push_back({x, y});
				} else if (h == best) {
					candidates.push_back({x, y});
				}
			}
		}
		if (candidates.empty()) {
			throw NoAttacksRemaining{};
		}
		if (best <= 0.0) {
			// nothing left to go by, take the first untried cell
			return candidates.front();
		}
		auto odd{std::find_if(candidates.begin(), candidates.end(),
			[](const Point& p) { return (p.x + p.y) % 2 == 1; })};
		return (odd != candidates.end()) ? *odd : candidates.front();
	}

	void register_attack(size_t x, size_t y, bool hit, bool sunk) override {
		Point p{x, y};
		view.set(p, hit ? HIT : MISS);
		attacked[y * ncols + x] = true;
		if (!hit) {
			return;
		}
		boost_neighbours(p);
		if (sunk) {
			auto ship{hit_cluster(p)};
			clear_sunk_area(ship);
			update_ship_count(ship);
		}
	}

	/* size and family of the hit cluster containing (x, y) */
	std::pair<size_t, ShapeFamily> analyze_ship_shape(size_t x, size_t y) const {
		auto cells{hit_cluster({x, y})};
		if (cells.empty()) {
			return {0, ShapeFamily::UNKNOWN};
		}
		return {cells.size(), classify(cells)};
	}

	bool all_ships_sunk() const {
		return std::accumulate(remaining.begin(), remaining.end(), size_t{}) == 0;
	}

	double probability(size_t x, size_t y) const {
		if ((x >= ncols) || (y >= nrows)) {
			throw std::out_of_range{"Coordinates out of bounds"};
		}
		return heat[y * ncols + x];
	}
	Grid get_enemy_board() const { return view; }
	ShipCounts get_remaining_ships() const { return remaining; }
};

} // namespace Salvo

#endif
