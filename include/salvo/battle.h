#ifndef SALVO_BATTLE_H
#define SALVO_BATTLE_H

#include "salvo/catalog.h"
#include "salvo/config.h"
#include "salvo/errors.h"
#include "salvo/game.h"
#include "salvo/placer.h"
#include "salvo/player.h"
#include "salvo/ship_counts.h"
#include "salvo/strategy.h"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Salvo {

struct MoveEvent {
	size_t index; // 1-based
	int side;	  // attacking player, 1 or 2
	Point target;
	bool hit;
	bool sunk;
};

struct BattleSummary {
	int winner; // 0 for a draw
	size_t moves;
};

/* "Move 3: Player 1 attacks (4,5) -> Hit and Sunk" */
inline std::string describe(const MoveEvent& m) {
	return "Move " + std::to_string(m.index) + ": Player " +
		   std::to_string(m.side) + " attacks (" + std::to_string(m.target.x) +
		   "," + std::to_string(m.target.y) + ") -> " +
		   (m.hit ? "Hit" : "Miss") + (m.sunk ? " and Sunk" : "");
}

/* Write-only listener; nothing it does feeds back into the battle. */
class BattleObserver {
	public:
	virtual ~BattleObserver() = default;
	virtual void battle_started(const BattleConfig&, int /* starting_side */,
		const std::array<Grid, 2>& /* boards */,
		const std::array<std::vector<ShipInstance>, 2>& /* ships */) {}
	virtual void move_made(const MoveEvent&) = 0;
	virtual void battle_finished(const BattleSummary&) {}
};

struct Side {
	std::unique_ptr<BoardSetup> setup;
	std::unique_ptr<Strategy> strategy;
};

inline Side make_default_side(const BattleConfig& c, uint32_t seed) {
	return Side{std::make_unique<RandomBoardSetup>(
					c.rows, c.cols, c.ship_counts, seed),
		std::make_unique<TargetingStrategy>(c.rows, c.cols, c.ship_counts)};
}

inline void check_ship_counts(const ShipCounts& counts) {
	if (required_tiles(counts) == 0) {
		throw InvalidShipCounts{"no ships requested"};
	}
}

class Battle {
	BattleConfig config;
	std::array<Side, 2> sides;
	std::array<Grid, 2> boards;
	std::array<std::vector<ShipInstance>, 2> ships;
	// attacks made by each side, kept here independently of the strategies
	std::array<std::unordered_set<Point>, 2> attacks;
	std::vector<BattleObserver*> observers;

	Grid checked_board(const BoardSetup& setup) const {
		auto g{setup.get_board()};
		if ((g.rows() != config.rows) || (g.cols() != config.cols)) {
			throw InvalidBoard{"expected " + std::to_string(config.cols) + "x" +
							   std::to_string(config.rows) + ", got " +
							   std::to_string(g.cols()) + "x" +
							   std::to_string(g.rows())};
		}
		for (size_t y = 0; y < g.rows(); y++) {
			for (size_t x = 0; x < g.cols(); x++) {
				if (g.at({x, y}) > num_ship_ids) {
					throw InvalidBoard{"unknown ship id at (" +
									   std::to_string(x) + "," +
									   std::to_string(y) + ")"};
				}
			}
		}
		return g;
	}

	/* the placed ships have to be exactly the requested fleet */
	void check_fleet(int side, const std::vector<ShipInstance>& fleet) const {
		ShipCounts found{};
		for (const auto& s : fleet) {
			if (s.coords.size() != shape_of(s.ship_id).tile_count) {
				throw InvalidBoard{"player " + std::to_string(side) +
								   " has a ship " + std::to_string(s.ship_id) +
								   " of " + std::to_string(s.coords.size()) +
								   " tiles"};
			}
			found[s.ship_id - 1]++;
		}
		if (found != config.ship_counts) {
			throw InvalidBoard{"player " + std::to_string(side) + " placed " +
							   format_ship_counts(found) + ", expected " +
							   format_ship_counts(config.ship_counts)};
		}
	}

	/* one attack by side (0 or 1); returns true if it wins the battle */
	bool turn(size_t index, size_t side) {
		auto& attacker{*sides[side].strategy};
		auto defender{1 - side};
		auto p{attacker.get_next_attack()};
		int player{static_cast<int>(side) + 1};
		if ((p.x >= config.cols) || (p.y >= config.rows)) {
			throw InvalidAttack{player, p, "outside the board"};
		}
		if (!attacks[side].insert(p).second) {
			throw InvalidAttack{player, p, "cell already attacked"};
		}
		auto [hit, sunk] = resolve_attack(p, ships[defender]);
		attacker.register_attack(p.x, p.y, hit, sunk);
		MoveEvent e{index, player, p, hit, sunk};
		for (auto* o : observers) {
			o->move_made(e);
		}
		return fleet_sunk(ships[defender]);
	}

	public:
	/* Places both fleets and labels their ships. Fails before any turn with
	 * InvalidShipCounts, InsufficientSpace, PlacementExhausted or
	 * InvalidBoard. */
	Battle(const BattleConfig& c, Side s1, Side s2)
		: config{c}, sides{std::move(s1), std::move(s2)},
		  boards{Grid{c.rows, c.cols}, Grid{c.rows, c.cols}} {
		check_ship_counts(config.ship_counts);
		for (size_t i = 0; i < 2; i++) {
			sides[i].setup->place_ships();
			boards[i] = checked_board(*sides[i].setup);
			ships[i] = extract_ships(boards[i]);
			check_fleet(static_cast<int>(i) + 1, ships[i]);
		}
	}
	Battle(const BattleConfig& c, uint32_t seed)
		: Battle{c, make_default_side(c, seed), make_default_side(c, seed + 1)} {
	}

	void add_observer(BattleObserver& o) { observers.push_back(&o); }

	/* Alternates turns starting with starting_side (1 or 2) until one fleet
	 * is sunk or rows * cols * draw_multiplier moves have been made. Since
	 * repeated attacks are rejected, that cap is only reached through the
	 * max_moves overload. */
	BattleSummary run(int starting_side) {
		return run(starting_side, config.rows * config.cols * draw_multiplier);
	}

	/* same, ending in a draw after max_moves moves */
	BattleSummary run(int starting_side, size_t max_moves) {
		if ((starting_side != 1) && (starting_side != 2)) {
			throw std::invalid_argument{
				"Starting side must be 1 or 2, got " +
				std::to_string(starting_side)};
		}
		for (auto* o : observers) {
			o->battle_started(config, starting_side, boards, ships);
		}
		size_t current{static_cast<size_t>(starting_side - 1)};
		BattleSummary summary{0, 0};
		while (summary.moves < max_moves) {
			summary.moves++;
			if (turn(summary.moves, current)) {
				summary.winner = static_cast<int>(current) + 1;
				break;
			}
			current = 1 - current;
		}
		for (auto* o : observers) {
			o->battle_finished(summary);
		}
		return summary;
	}

	const BattleConfig& configuration() const { return config; }
	/* side is 1 or 2 */
	const Grid& board(int side) const { return boards.at(side - 1); }
	const std::vector<ShipInstance>& fleet(int side) const {
		return ships.at(side - 1);
	}
	const std::unordered_set<Point>& attacks_by(int side) const {
		return attacks.at(side - 1);
	}
	/* a side's board with the opponent's attacks drawn over it */
	Grid display(int side) const {
		return display_grid(board(side), fleet(side), attacks_by(3 - side));
	}
};

} // namespace Salvo

#endif
