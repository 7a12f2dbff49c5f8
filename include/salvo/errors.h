#ifndef SALVO_ERRORS_H
#define SALVO_ERRORS_H

#include "salvo/game.h"
#include <stdexcept>
#include <string>

namespace Salvo {

class InsufficientSpace : public std::runtime_error {
	public:
	InsufficientSpace(size_t required, size_t available)
		: std::runtime_error{"Not enough space to place all ships: " +
							 std::to_string(required) + " tiles on " +
							 std::to_string(available) + " cells"} {}
};

class PlacementExhausted : public std::runtime_error {
	public:
	PlacementExhausted(size_t restarts)
		: std::runtime_error{"Ship placement failed after " +
							 std::to_string(restarts) + " restarts"} {}
};

class InvalidAttack : public std::runtime_error {
	int attacker;
	Point target;

	public:
	InvalidAttack(int side, Point p, const std::string& reason)
		: std::runtime_error{"Player " + std::to_string(side) +
							 " made an invalid attack at (" +
							 std::to_string(p.x) + "," + std::to_string(p.y) +
							 "): " + reason},
		  attacker{side}, target{p} {}
	int side() const { return attacker; }
	Point point() const { return target; }
};

class NoAttacksRemaining : public std::runtime_error {
	public:
	NoAttacksRemaining() : std::runtime_error{"No remaining attack positions"} {}
};

class InvalidShipCounts : public std::invalid_argument {
	public:
	InvalidShipCounts(const std::string& m)
		: std::invalid_argument{"Invalid ship counts: " + m} {}
};

class InvalidBoard : public std::runtime_error {
	public:
	InvalidBoard(const std::string& m)
		: std::runtime_error{"Invalid board: " + m} {}
};

} // namespace Salvo

#endif
