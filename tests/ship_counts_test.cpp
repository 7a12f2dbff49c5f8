#include "salvo/catalog.h"
#include "salvo/errors.h"
#include "salvo/ship_counts.h"
#include <gtest/gtest.h>
#include <random>

using namespace Salvo;

TEST(RandomShipCounts, CoversThirtyPercent) {
	for (uint32_t seed = 0; seed < 20; seed++) {
		std::mt19937 r{seed};
		auto counts{random_ship_counts(10, 10, r)};
		auto tiles{required_tiles(counts)};
		EXPECT_GE(tiles, 30u);
		// stops as soon as the target is reached
		EXPECT_LT(tiles, 30u + 6u);
	}
}

TEST(RandomShipCounts, ScalesWithBoard) {
	std::mt19937 r{5};
	EXPECT_GE(required_tiles(random_ship_counts(20, 15, r)), 90u);
	EXPECT_EQ(random_ship_counts(1, 3, r), ShipCounts{});
}

TEST(RandomShipCounts, Reproducible) {
	std::mt19937 a{77}, b{77};
	EXPECT_EQ(random_ship_counts(12, 9, a), random_ship_counts(12, 9, b));
}

TEST(ParseShipCounts, AcceptsSevenCounts) {
	EXPECT_EQ(parse_ship_counts("1,0,2,0,0,1,0"),
		(ShipCounts{1, 0, 2, 0, 0, 1, 0}));
	EXPECT_EQ(parse_ship_counts("0,0,0,0,0,0,12"),
		(ShipCounts{0, 0, 0, 0, 0, 0, 12}));
}

TEST(ParseShipCounts, RejectsMalformedLists) {
	for (const char* bad : {"", "1,2,3", "1,0,2,0,0,1,0,4", "1,0,2,0,0,1,0,",
			 "1,0,2,,0,1,0", "1,0,-2,0,0,1,0", "1,0,x,0,0,1,0",
			 "1, 0,2,0,0,1,0", "1,0,2,0,0,1,99999999999999999999999"}) {
		EXPECT_THROW(parse_ship_counts(bad), InvalidShipCounts) << bad;
	}
}

TEST(FormatShipCounts, ListsCounts) {
	EXPECT_EQ(format_ship_counts(ShipCounts{1, 0, 2, 0, 0, 1, 0}),
		"[1, 0, 2, 0, 0, 1, 0]");
	EXPECT_EQ(format_ship_counts(ShipCounts{}), "[0, 0, 0, 0, 0, 0, 0]");
}
