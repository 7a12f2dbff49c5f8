#ifndef SALVO_PLAYER_H
#define SALVO_PLAYER_H

#include "salvo/game.h"

namespace Salvo {

/* Places one side's fleet. Constructed with (rows, cols, ship_counts).
 * get_board() hands out a copy; the engine reads it once, right after
 * place_ships(), and never touches the implementation's own grid. */
class BoardSetup {
	public:
	virtual ~BoardSetup() = default;
	virtual void place_ships() = 0;
	virtual Grid get_board() const = 0;
};

/* Chooses attacks against the opponent. Constructed with (rows, cols,
 * ship_counts) describing the fleet to sink; it only ever learns the outcome
 * of its own attacks. */
class Strategy {
	public:
	virtual ~Strategy() = default;
	virtual Point get_next_attack() = 0;
	virtual void register_attack(size_t x, size_t y, bool hit, bool sunk) = 0;
};

} // namespace Salvo

#endif
