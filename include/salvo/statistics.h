#ifndef SALVO_STATISTICS_H
#define SALVO_STATISTICS_H

#include "salvo/battle.h"
#include <array>
#include <iomanip>
#include <ostream>

namespace Salvo {

/* Win counts and move totals over many battles. merge() is associative and
 * commutative, so partial results can be combined in any order. */
struct Statistics {
	std::array<size_t, 3> wins{}; // indexed by winner, 0 = draw
	size_t battles{};
	size_t total_moves{};

	void record(const BattleSummary& s) {
		wins.at(s.winner)++;
		battles++;
		total_moves += s.moves;
	}
	Statistics& merge(const Statistics& b) {
		for (size_t i = 0; i < wins.size(); i++) {
			wins[i] += b.wins[i];
		}
		battles += b.battles;
		total_moves += b.total_moves;
		return *this;
	}
	double average_moves() const {
		return battles ? static_cast<double>(total_moves) / battles : 0.0;
	}
	bool operator==(const Statistics&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Statistics& s) {
	os << "=== Overall Battle Results ===\n";
	os << "Total battles: " << s.battles << "\n";
	os << "Player 1 wins: " << s.wins[1] << "\n";
	os << "Player 2 wins: " << s.wins[2] << "\n";
	os << "Draws: " << s.wins[0] << "\n";
	os << "Average game length: " << std::fixed << std::setprecision(2)
	   << s.average_moves() << " moves\n";
	return os;
}

} // namespace Salvo

#endif
