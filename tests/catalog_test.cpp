#include "salvo/catalog.h"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace Salvo;

namespace {

std::vector<Point> cells_of(const Shape& s) {
	std::vector<Point> r;
	for (auto [dx, dy] : normalize(s)) {
		r.push_back({static_cast<size_t>(dx) + 5, static_cast<size_t>(dy) + 5});
	}
	return r;
}

} // namespace

TEST(Catalog, VariantsMatchTileCounts) {
	for (size_t id = 1; id <= num_ship_ids; id++) {
		const auto& def{shape_of(id)};
		EXPECT_EQ(def.ship_id, id);
		ASSERT_FALSE(def.variants.empty());
		for (const auto& v : def.variants) {
			EXPECT_EQ(v.size(), def.tile_count) << "ship id " << id;
		}
	}
}

TEST(Catalog, KnownSizes) {
	const size_t sizes[]{2, 3, 4, 4, 4, 4, 6};
	for (size_t i = 0; i < num_ship_ids; i++) {
		EXPECT_EQ(catalog[i].tile_count, sizes[i]);
	}
	EXPECT_EQ(shape_of(4).family, ShapeFamily::T);
	EXPECT_EQ(shape_of(5).family, ShapeFamily::L);
	EXPECT_EQ(shape_of(6).family, ShapeFamily::Z);
	EXPECT_EQ(shape_of(7).family, ShapeFamily::DOUBLE_T);
}

TEST(Catalog, UnknownIdThrows) {
	EXPECT_THROW(shape_of(0), std::out_of_range);
	EXPECT_THROW(shape_of(8), std::out_of_range);
}

TEST(Catalog, RequiredTiles) {
	EXPECT_EQ(required_tiles(ShipCounts{}), 0u);
	EXPECT_EQ(required_tiles(ShipCounts{1, 0, 0, 0, 0, 0, 0}), 2u);
	EXPECT_EQ(required_tiles(ShipCounts{1, 1, 1, 1, 1, 1, 1}), 27u);
	EXPECT_EQ(required_tiles(ShipCounts{0, 2, 0, 0, 0, 0, 3}), 24u);
}

TEST(Catalog, RequiredTilesSaturates) {
	constexpr size_t max{std::numeric_limits<size_t>::max()};
	EXPECT_EQ(required_tiles(ShipCounts{max / 2 + 1, 0, 0, 0, 0, 0, 0}), max);
	EXPECT_EQ(required_tiles(ShipCounts{max / 2, 0, 0, 0, 0, 0, 1}), max);
	EXPECT_EQ(required_tiles(ShipCounts{0, 0, 0, 0, 0, 0, max}), max);
	EXPECT_EQ(required_tiles(ShipCounts{max / 2, 0, 0, 0, 0, 0, 0}), max - 1);
}

TEST(Rotate, QuarterTurns) {
	Shape s{{0, 0}, {1, 0}, {2, 0}};
	EXPECT_EQ(rotate(s, 0), s);
	EXPECT_EQ(rotate(s, 90), (Shape{{0, 0}, {0, 1}, {0, 2}}));
	EXPECT_EQ(rotate(s, 180), (Shape{{0, 0}, {-1, 0}, {-2, 0}}));
	EXPECT_EQ(rotate(s, 270), (Shape{{0, 0}, {0, -1}, {0, -2}}));
}

TEST(Normalize, MovesToOrigin) {
	EXPECT_EQ(normalize(Shape{{-2, 0}, {-1, 0}, {0, 0}}),
		(Shape{{0, 0}, {1, 0}, {2, 0}}));
	EXPECT_EQ(normalize(Shape{{3, 5}, {2, 6}}), (Shape{{1, 0}, {0, 1}}));
}

TEST(Classify, RecognisesEveryRotationOfEveryShape) {
	for (const auto& def : catalog) {
		for (const auto& v : def.variants) {
			for (int deg : {0, 90, 180, 270}) {
				EXPECT_EQ(classify(cells_of(rotate(v, deg))), def.family)
					<< "ship id " << int{def.ship_id} << " at " << deg;
			}
		}
	}
}

TEST(Classify, StraightOfAnyLength) {
	EXPECT_EQ(classify({{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}}),
		ShapeFamily::STRAIGHT);
	EXPECT_EQ(classify({{3, 3}}), ShapeFamily::STRAIGHT);
}

TEST(Classify, UnknownShapes) {
	// a 2x2 square is in no catalog
	EXPECT_EQ(classify({{0, 0}, {1, 0}, {0, 1}, {1, 1}}), ShapeFamily::UNKNOWN);
	EXPECT_EQ(classify({}), ShapeFamily::UNKNOWN);
}
