#ifndef SALVO_CATALOG_H
#define SALVO_CATALOG_H

#include "salvo/config.h"
#include "salvo/game.h"
#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace Salvo {

enum class ShapeFamily { STRAIGHT, T, L, Z, DOUBLE_T, UNKNOWN };

inline const char* family_name(ShapeFamily f) {
	switch (f) {
	case ShapeFamily::STRAIGHT:
		return "I";
	case ShapeFamily::T:
		return "T";
	case ShapeFamily::L:
		return "L";
	case ShapeFamily::Z:
		return "Z";
	case ShapeFamily::DOUBLE_T:
		return "TT";
	default:
		return "Unknown";
	}
}

// cell offset relative to a placement anchor
struct Offset {
	int dx;
	int dy;
	bool operator==(const Offset& b) const {
		return (dx == b.dx) && (dy == b.dy);
	}
	bool operator<(const Offset& b) const {
		return (dy < b.dy) || ((dy == b.dy) && (dx < b.dx));
	}
};

using Shape = std::vector<Offset>;

struct ShapeDefinition {
	Cell ship_id;
	size_t tile_count;
	ShapeFamily family;
	// geometric variants, one is picked at random for every placed ship
	std::vector<Shape> variants;
};

inline const std::array<ShapeDefinition, num_ship_ids> catalog{{
	{1, 2, ShapeFamily::STRAIGHT, {{{0, 0}, {1, 0}}}},
	{2, 3, ShapeFamily::STRAIGHT, {{{0, 0}, {1, 0}, {2, 0}}}},
	{3, 4, ShapeFamily::STRAIGHT, {{{0, 0}, {1, 0}, {2, 0}, {3, 0}}}},
	{4, 4, ShapeFamily::T, {{{0, 0}, {1, 0}, {2, 0}, {1, 1}}}},
	{5, 4, ShapeFamily::L,
		{{{0, 0}, {0, 1}, {0, 2}, {1, 2}}, {{0, 0}, {1, 0}, {2, 0}, {2, 1}},
			{{0, 0}, {1, 0}, {2, 0}, {0, 1}},
			{{0, 0}, {0, 1}, {1, 1}, {2, 1}}}},
	{6, 4, ShapeFamily::Z,
		{{{0, 0}, {1, 0}, {1, 1}, {2, 1}}, {{0, 1}, {1, 1}, {1, 0}, {2, 0}}}},
	//  **
	// ****
	{7, 6, ShapeFamily::DOUBLE_T,
		{{{1, 0}, {2, 0}, {0, 1}, {1, 1}, {2, 1}, {3, 1}}}},
}};

inline const ShapeDefinition& shape_of(size_t ship_id) {
	if ((ship_id < 1) || (ship_id > num_ship_ids)) {
		throw std::out_of_range{"Unknown ship id " + std::to_string(ship_id)};
	}
	return catalog[ship_id - 1];
}

/* total tiles of a fleet, saturating at the largest size_t */
inline size_t required_tiles(const ShipCounts& counts) {
	constexpr size_t max{std::numeric_limits<size_t>::max()};
	size_t total{};
	for (size_t i = 0; i < num_ship_ids; i++) {
		if (counts[i] > (max - total) / catalog[i].tile_count) {
			return max;
		}
		total += catalog[i].tile_count * counts[i];
	}
	return total;
}

/* rotation by 0, 90, 180 or 270 degrees around the anchor */
inline Shape rotate(const Shape& s, int degrees) {
	Shape r;
	r.reserve(s.size());
	for (auto [dx, dy] : s) {
		if (degrees == 90) {
			r.push_back({-dy, dx});
		} else if (degrees == 180) {
			r.push_back({-dx, -dy});
		} else if (degrees == 270) {
			r.push_back({dy, -dx});
		} else {
			r.push_back({dx, dy});
		}
	}
	return r;
}

/* shifts a shape so its bounding box starts at (0, 0), cells sorted */
inline Shape normalize(Shape s) {
	int min_x{std::numeric_limits<int>::max()}, min_y{min_x};
	for (const auto& o : s) {
		min_x = std::min(min_x, o.dx);
		min_y = std::min(min_y, o.dy);
	}
	for (auto& o : s) {
		o.dx -= min_x;
		o.dy -= min_y;
	}
	std::sort(s.begin(), s.end());
	return s;
}

/* Best guess of the family of a connected cluster of cells. Any one cell wide
 * cluster is straight; otherwise the cluster has to equal some rotation of a
 * catalog variant. */
inline ShapeFamily classify(const std::vector<Point>& cells) {
	if (cells.empty()) {
		return ShapeFamily::UNKNOWN;
	}
	Shape s;
	size_t min_x{cells.front().x}, max_x{min_x};
	size_t min_y{cells.front().y}, max_y{min_y};
	for (const auto& p : cells) {
		min_x = std::min(min_x, p.x);
		max_x = std::max(max_x, p.x);
		min_y = std::min(min_y, p.y);
		max_y = std::max(max_y, p.y);
		s.push_back({static_cast<int>(p.x), static_cast<int>(p.y)});
	}
	if ((min_x == max_x) || (min_y == max_y)) {
		return ShapeFamily::STRAIGHT;
	}
	auto norm{normalize(std::move(s))};
	for (const auto& def : catalog) {
		if (def.tile_count != norm.size()) {
			continue;
		}
		for (const auto& v : def.variants) {
			for (int deg : {0, 90, 180, 270}) {
				if (normalize(rotate(v, deg)) == norm) {
					return def.family;
				}
			}
		}
	}
	return ShapeFamily::UNKNOWN;
}

} // namespace Salvo

#endif
