#include "salvo/game.h"
#include "test_players.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

using namespace Salvo;
using Salvo::Testing::make_grid;

TEST(Grid, StartsEmpty) {
	Grid g{3, 4};
	EXPECT_EQ(g.rows(), 3u);
	EXPECT_EQ(g.cols(), 4u);
	EXPECT_EQ(g.area(), 12u);
	EXPECT_EQ(g.occupied(), 0u);
	EXPECT_EQ(g.at({3, 2}), EMPTY);
}

TEST(Grid, RejectsOutOfBounds) {
	Grid g{3, 4};
	EXPECT_THROW(g.at({4, 0}), std::out_of_range);
	EXPECT_THROW(g.at({0, 3}), std::out_of_range);
	EXPECT_THROW(g.set({4, 0}, 1), std::out_of_range);
	EXPECT_FALSE(g.contains({4, 2}));
	EXPECT_TRUE(g.contains({3, 2}));
}

TEST(Grid, NeighboursStayInside) {
	Grid g{3, 3};
	EXPECT_EQ(g.neighbours({0, 0}).size(), 2u);
	EXPECT_EQ(g.neighbours({1, 0}).size(), 3u);
	EXPECT_EQ(g.neighbours({1, 1}).size(), 4u);
	EXPECT_EQ(g.neighbours({2, 2}).size(), 2u);
}

TEST(FloodFill, FollowsOrthogonalNeighboursOnly) {
	auto g{make_grid(3, 3, {{{0, 0}, 1}, {{1, 1}, 1}, {{1, 0}, 1}, {{2, 2}, 1}})};
	auto region{flood_fill(3, 3, Point{0, 0},
		[&g](Point p) { return g.at(p) == 1; })};
	EXPECT_EQ(region.size(), 3u);
	EXPECT_EQ(std::count(region.begin(), region.end(), Point{2, 2}), 0);
}

TEST(FloodFill, EmptyWhenStartDoesNotMatch) {
	Grid g{3, 3};
	EXPECT_TRUE(flood_fill(3, 3, Point{1, 1}, [&g](Point p) {
		return g.at(p) != EMPTY;
	}).empty());
	EXPECT_TRUE(flood_fill(3, 3, Point{5, 1}, [](Point) { return true; }).empty());
}

TEST(ExtractShips, OneInstancePerComponent) {
	auto g{make_grid(5, 5,
		{{{0, 0}, 1}, {{1, 0}, 1}, {{4, 0}, 1}, {{4, 1}, 1}, {{0, 2}, 2},
			{{0, 3}, 2}, {{0, 4}, 2}})};
	auto ships{extract_ships(g)};
	ASSERT_EQ(ships.size(), 3u);
	// row-major order of each ship's first cell
	EXPECT_EQ(ships[0].ship_id, 1);
	EXPECT_TRUE(ships[0].coords.contains({0, 0}));
	EXPECT_EQ(ships[1].ship_id, 1);
	EXPECT_TRUE(ships[1].coords.contains({4, 1}));
	EXPECT_EQ(ships[2].ship_id, 2);
	EXPECT_EQ(ships[2].coords.size(), 3u);
	for (const auto& s : ships) {
		EXPECT_TRUE(s.hits.empty());
	}
}

TEST(ExtractShips, DifferentIdsAreDifferentShips) {
	auto g{make_grid(2, 4, {{{0, 0}, 1}, {{1, 0}, 1}, {{2, 0}, 2}, {{3, 0}, 2}})};
	auto ships{extract_ships(g)};
	ASSERT_EQ(ships.size(), 2u);
	EXPECT_EQ(ships[0].coords.size(), 2u);
	EXPECT_EQ(ships[1].coords.size(), 2u);
}

TEST(ResolveAttack, SinksOnLastCell) {
	auto g{make_grid(5, 5, {{{1, 1}, 2}, {{2, 1}, 2}, {{3, 1}, 2}})};
	auto ships{extract_ships(g)};
	EXPECT_EQ(resolve_attack({1, 1}, ships), std::make_pair(true, false));
	EXPECT_EQ(resolve_attack({2, 1}, ships), std::make_pair(true, false));
	EXPECT_FALSE(ships[0].sunk());
	EXPECT_EQ(resolve_attack({3, 1}, ships), std::make_pair(true, true));
	EXPECT_TRUE(ships[0].sunk());
}

TEST(ResolveAttack, RepeatedHitIsIdempotent) {
	auto g{make_grid(5, 5, {{{1, 1}, 1}, {{2, 1}, 1}})};
	auto ships{extract_ships(g)};
	EXPECT_EQ(resolve_attack({1, 1}, ships), std::make_pair(true, false));
	EXPECT_EQ(resolve_attack({1, 1}, ships), std::make_pair(true, false));
	EXPECT_EQ(ships[0].hits.size(), 1u);
	EXPECT_FALSE(ships[0].sunk());
	EXPECT_EQ(resolve_attack({2, 1}, ships), std::make_pair(true, true));
	EXPECT_EQ(resolve_attack({2, 1}, ships), std::make_pair(true, true));
	EXPECT_EQ(ships[0].hits.size(), 2u);
}

TEST(ResolveAttack, MissLeavesShipsAlone) {
	auto ships{extract_ships(Salvo::Testing::single_destroyer())};
	EXPECT_EQ(resolve_attack({5, 5}, ships), std::make_pair(false, false));
	EXPECT_TRUE(ships[0].hits.empty());
}

TEST(ResolveAttack, DestroyerOnEmptyBoard) {
	auto ships{extract_ships(Salvo::Testing::single_destroyer())};
	EXPECT_EQ(resolve_attack({0, 0}, ships), std::make_pair(true, false));
	EXPECT_EQ(resolve_attack({1, 0}, ships), std::make_pair(true, true));
	EXPECT_EQ(resolve_attack({5, 5}, ships), std::make_pair(false, false));
	EXPECT_TRUE(fleet_sunk(ships));
}

TEST(FleetSunk, NeedsEveryShip) {
	auto g{make_grid(5, 5, {{{0, 0}, 1}, {{1, 0}, 1}, {{4, 4}, 1}, {{4, 3}, 1}})};
	auto ships{extract_ships(g)};
	resolve_attack({0, 0}, ships);
	resolve_attack({1, 0}, ships);
	EXPECT_FALSE(fleet_sunk(ships));
	resolve_attack({4, 4}, ships);
	resolve_attack({4, 3}, ships);
	EXPECT_TRUE(fleet_sunk(ships));
}

TEST(DisplayGrid, MarksHitsSunkAndMisses) {
	auto g{make_grid(4, 4,
		{{{0, 0}, 1}, {{1, 0}, 1}, {{3, 1}, 2}, {{3, 2}, 2}, {{3, 3}, 2}})};
	auto ships{extract_ships(g)};
	std::unordered_set<Point> attacked{{0, 0}, {1, 0}, {3, 1}, {2, 2}};
	for (const auto& p : attacked) {
		resolve_attack(p, ships);
	}
	auto d{display_grid(g, ships, attacked)};
	EXPECT_EQ(d.at({0, 0}), SUNK);
	EXPECT_EQ(d.at({1, 0}), SUNK);
	EXPECT_EQ(d.at({3, 1}), HIT);
	EXPECT_EQ(d.at({3, 2}), 2);
	EXPECT_EQ(d.at({2, 2}), MISS);
	EXPECT_EQ(d.at({0, 3}), EMPTY);
	// the board itself is untouched
	EXPECT_EQ(g.at({0, 0}), 1);
}

TEST(SortedPoints, OrdersByColumnThenRow) {
	auto v{sorted_points({{1, 0}, {0, 2}, {0, 1}})};
	ASSERT_EQ(v.size(), 3u);
	EXPECT_EQ(v[0], (Point{0, 1}));
	EXPECT_EQ(v[1], (Point{0, 2}));
	EXPECT_EQ(v[2], (Point{1, 0}));
}
