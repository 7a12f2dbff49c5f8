#ifndef SALVO_BATTLE_LOG_H
#define SALVO_BATTLE_LOG_H

#include "salvo/battle.h"
#include "salvo/messages.h"
#include "salvo/ship_counts.h"
#include "salvo/wrapped_posix.h"
#include <array>
#include <iostream>
#include <string>
#include <vector>

namespace Salvo {

inline std::string describe(const BattleSummary& s) {
	if (s.winner == 0) {
		return "Battle ended in a draw after " + std::to_string(s.moves) +
			   " moves.";
	}
	return "Player " + std::to_string(s.winner) + " wins after " +
		   std::to_string(s.moves) + " moves!";
}

/* "Ship ID 3: [(0,1), (1,1), (2,1), (3,1)]" */
inline std::string describe(const ShipInstance& s) {
	std::string r{"Ship ID " + std::to_string(s.ship_id) + ": ["};
	bool first{true};
	for (const auto& p : sorted_points(s.coords)) {
		r += (first ? "(" : ", (") + std::to_string(p.x) + "," +
			 std::to_string(p.y) + ")";
		first = false;
	}
	return r + "]";
}

/* Human readable battle log, one line per move. */
class TextLog : public BattleObserver {
	FileDescriptor file;

	void line(const std::string& s) { write_all(file, s + "\n"); }

	public:
	TextLog(const std::string& path) : file{open_for_writing(path), path} {}
	void battle_started(const BattleConfig& c, int starting_side,
		const std::array<Grid, 2>&,
		const std::array<std::vector<ShipInstance>, 2>& ships) override {
		line("New battle started: " + std::to_string(c.cols) + "x" +
			 std::to_string(c.rows) +
			 ", ships: " + format_ship_counts(c.ship_counts));
		line("Player " + std::to_string(starting_side) + " starts");
		for (size_t i = 0; i < ships.size(); i++) {
			line("P" + std::to_string(i + 1) + "_board:");
			for (const auto& s : ships[i]) {
				line(" " + describe(s));
			}
		}
	}
	void move_made(const MoveEvent& m) override { line(describe(m)); }
	void battle_finished(const BattleSummary& s) override { line(describe(s)); }
};

/* Length-prefixed protobuf records, replayed by the viewer. */
class RecordWriter : public BattleObserver {
	FileDescriptor file;

	void emit(const Messages::Wire& w) { write_all(file, serialize(w)); }

	public:
	RecordWriter(const std::string& path) : file{open_for_writing(path), path} {}
	void battle_started(const BattleConfig& c, int starting_side,
		const std::array<Grid, 2>& boards,
		const std::array<std::vector<ShipInstance>, 2>& ships) override {
		Messages::Wire w;
		auto start{w.mutable_start()};
		start->set_rows(c.rows);
		start->set_cols(c.cols);
		for (auto n : c.ship_counts) {
			start->add_ship_counts(n);
		}
		start->set_starting_side(starting_side);
		emit(w);
		for (size_t i = 0; i < boards.size(); i++) {
			Messages::Wire g;
			*(g.mutable_grid()) = pb_obj_from_ships(i + 1, boards[i], ships[i]);
			emit(g);
		}
	}
	void move_made(const MoveEvent& m) override {
		Messages::Wire w;
		*(w.mutable_move()) = pb_obj_from_move(m);
		emit(w);
	}
	void battle_finished(const BattleSummary& s) override {
		Messages::Wire w;
		w.mutable_result()->set_code(
			s.winner ? Messages::Result::WIN : Messages::Result::DRAW);
		w.mutable_result()->set_winner(s.winner);
		w.mutable_result()->set_moves(s.moves);
		emit(w);
	}
};

/* Prints moves and outcome to a stream, for verbose runs. */
class MoveReporter : public BattleObserver {
	std::ostream& os;
	const Battle* battle;

	public:
	MoveReporter(std::ostream& o, const Battle* b = nullptr) : os{o}, battle{b} {}
	void move_made(const MoveEvent& m) override { os << describe(m) << "\n"; }
	void battle_finished(const BattleSummary& s) override {
		os << describe(s) << "\n";
		if (battle != nullptr) {
			for (int side : {1, 2}) {
				os << "Player " << side << " board:\n" << battle->display(side);
			}
		}
	}
};

} // namespace Salvo

#endif
