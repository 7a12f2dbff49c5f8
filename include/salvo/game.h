#ifndef SALVO_GAME_H
#define SALVO_GAME_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Salvo {

struct Point {
	size_t x;
	size_t y;
	bool operator==(const Point& b) const { return (x == b.x) && (y == b.y); }
	bool operator<(const Point& b) const {
		return (y < b.y) || ((y == b.y) && (x < b.x));
	}
};

} // namespace Salvo

namespace std {
template <> struct hash<Salvo::Point> {
	size_t operator()(const Salvo::Point& p) const {
		return std::hash<decltype(Salvo::Point::x)>{}(p.x) ^
			   (std::hash<decltype(Salvo::Point::y)>{}(p.y) << 1);
	}
};
} // namespace std

namespace Salvo {

using Cell = uint8_t;

// 1..7 are ship ids; the rest only appear on display grids
enum Tag : Cell { EMPTY = 0, HIT = 8, SUNK = 9, MISS = 10 };

class Grid {
	size_t nrows, ncols;
	std::vector<Cell> cells;

	public:
	Grid(size_t rows, size_t cols)
		: nrows{rows}, ncols{cols}, cells(rows * cols, EMPTY) {}
	size_t rows() const { return nrows; }
	size_t cols() const { return ncols; }
	size_t area() const { return cells.size(); }
	bool contains(Point p) const { return (p.x < ncols) && (p.y < nrows); }
	Cell at(Point p) const {
		if (!contains(p)) {
			throw std::out_of_range{"Coordinates out of bounds"};
		}
		return cells[p.y * ncols + p.x];
	}
	void set(Point p, Cell c) {
		if (!contains(p)) {
			throw std::out_of_range{"Coordinates out of bounds"};
		}
		cells[p.y * ncols + p.x] = c;
	}
	void clear() { std::fill(cells.begin(), cells.end(), EMPTY); }
	size_t occupied() const {
		return cells.size() - std::count(cells.begin(), cells.end(), EMPTY);
	}
	bool operator==(const Grid& b) const {
		return (nrows == b.nrows) && (ncols == b.ncols) && (cells == b.cells);
	}
	/* orthogonal neighbours inside the grid */
	std::vector<Point> neighbours(Point p) const {
		std::vector<Point> r;
		r.reserve(4);
		if (p.x > 0) {
			r.push_back({p.x - 1, p.y});
		}
		if (p.x + 1 < ncols) {
			r.push_back({p.x + 1, p.y});
		}
		if (p.y > 0) {
			r.push_back({p.x, p.y - 1});
		}
		if (p.y + 1 < nrows) {
			r.push_back({p.x, p.y + 1});
		}
		return r;
	}
};

inline std::ostream& operator<<(std::ostream& os, const Grid& g) {
	constexpr char symbols[]{".1234567XS~"};
	for (size_t y = 0; y < g.rows(); y++) {
		for (size_t x = 0; x < g.cols(); x++) {
			auto c{g.at({x, y})};
			os << ((c < sizeof(symbols) - 1) ? symbols[c] : '?');
		}
		os << '\n';
	}
	return os;
}

struct ShipInstance {
	Cell ship_id;
	std::unordered_set<Point> coords;
	std::unordered_set<Point> hits;
	bool sunk() const { return hits == coords; }
};

/* Collects the 4-connected region around start whose cells satisfy member.
 * The worklist is explicit, so region size is not bounded by the stack. */
template <typename Pred>
std::vector<Point> flood_fill(size_t rows, size_t cols, Point start, Pred member) {
	std::vector<Point> region;
	if ((start.x >= cols) || (start.y >= rows) || !member(start)) {
		return region;
	}
	std::vector<bool> visited(rows * cols, false);
	std::vector<Point> stack{start};
	visited[start.y * cols + start.x] = true;
	while (!stack.empty()) {
		auto p{stack.back()};
		stack.pop_back();
		region.push_back(p);
		const Point candidates[]{{p.x - 1, p.y}, {p.x + 1, p.y},
			{p.x, p.y - 1}, {p.x, p.y + 1}};
		for (const auto& n : candidates) {
			// unsigned wrap-around puts x - 1 at 0 out of range as well
			if ((n.x >= cols) || (n.y >= rows) || visited[n.y * cols + n.x]) {
				continue;
			}
			if (member(n)) {
				visited[n.y * cols + n.x] = true;
				stack.push_back(n);
			}
		}
	}
	return region;
}

/* one instance per connected group of equal ship ids, in row-major order of
 * each group's first cell */
inline std::vector<ShipInstance> extract_ships(const Grid& g) {
	std::vector<ShipInstance> ships;
	std::vector<bool> seen(g.area(), false);
	for (size_t y = 0; y < g.rows(); y++) {
		for (size_t x = 0; x < g.cols(); x++) {
			auto id{g.at({x, y})};
			if ((id == EMPTY) || seen[y * g.cols() + x]) {
				continue;
			}
			auto region{flood_fill(g.rows(), g.cols(), Point{x, y},
				[&g, id](Point p) { return g.at(p) == id; })};
			ShipInstance ship{id, {}, {}};
			for (const auto& p : region) {
				seen[p.y * g.cols() + p.x] = true;
				ship.coords.insert(p);
			}
			ships.emplace_back(std::move(ship));
		}
	}
	return ships;
}

/* returns {hit, sunk}; a repeated hit on the same cell changes nothing */
inline std::pair<bool, bool> resolve_attack(
	Point p, std::vector<ShipInstance>& ships) {
	for (auto& s : ships) {
		if (s.coords.contains(p)) {
			s.hits.insert(p);
			return {true, s.sunk()};
		}
	}
	return {false, false};
}

inline bool fleet_sunk(const std::vector<ShipInstance>& ships) {
	return std::all_of(ships.begin(), ships.end(),
		[](const ShipInstance& s) { return s.sunk(); });
}

inline std::vector<Point> sorted_points(const std::unordered_set<Point>& pts) {
	std::vector<Point> r{pts.begin(), pts.end()};
	std::sort(r.begin(), r.end(), [](const Point& a, const Point& b) {
		return (a.x < b.x) || ((a.x == b.x) && (a.y < b.y));
	});
	return r;
}

/* copy of a side's board with attack outcomes drawn over it */
inline Grid display_grid(const Grid& board,
	const std::vector<ShipInstance>& ships,
	const std::unordered_set<Point>& attacked) {
	Grid g{board};
	for (const auto& p : attacked) {
		if (g.contains(p) && (board.at(p) == EMPTY)) {
			g.set(p, MISS);
		}
	}
	for (const auto& s : ships) {
		for (const auto& p : s.hits) {
			g.set(p, s.sunk() ? SUNK : HIT);
		}
	}
	return g;
}

} // namespace Salvo

#endif
