#include "salvo/messages.h"
#include "test_players.h"
#include <arpa/inet.h>
#include <cstring>
#include <gtest/gtest.h>

using namespace Salvo;
using namespace Salvo::Testing;

TEST(Messages, SerializePrefixesLength) {
	Messages::Wire w;
	w.mutable_move()->set_index(7);
	w.mutable_move()->set_x(3);
	auto s{serialize(w)};
	ASSERT_GE(s.size(), sizeof(uint32_t));
	uint32_t len{};
	std::memcpy(&len, s.data(), sizeof(len));
	EXPECT_EQ(ntohl(len), s.size() - sizeof(uint32_t));
	Messages::Wire back;
	ASSERT_TRUE(back.ParseFromString(s.substr(sizeof(uint32_t))));
	EXPECT_TRUE(back.has_move());
	EXPECT_FALSE(back.has_grid());
	EXPECT_EQ(back.move().index(), 7u);
	EXPECT_EQ(back.move().x(), 3u);
}

TEST(Messages, EmptyMessageIsJustPrefix) {
	EXPECT_EQ(serialize(Messages::Wire{}), std::string(4, '\0'));
}

TEST(Messages, ShipsSurviveConversion) {
	auto board{make_grid(6, 8,
		{{{0, 0}, 1}, {{1, 0}, 1}, {{4, 2}, 4}, {{5, 2}, 4}, {{6, 2}, 4},
			{{5, 3}, 4}})};
	auto ships{extract_ships(board)};
	auto pg{pb_obj_from_ships(2, board, ships)};
	EXPECT_EQ(pg.side(), 2u);
	EXPECT_EQ(pg.rows(), 6u);
	EXPECT_EQ(pg.cols(), 8u);
	ASSERT_EQ(pg.ships_size(), 2);
	EXPECT_EQ(pg.ships(1).ship_id(), 4u);
	// points go out sorted by x, then y
	EXPECT_EQ(pg.ships(1).points(0).x(), 4u);
	EXPECT_EQ(pg.ships(1).points(2).x(), 5u);
	EXPECT_EQ(pg.ships(1).points(2).y(), 3u);

	EXPECT_EQ(grid_from_pb_obj(pg), board);
	auto back{ships_from_pb_obj(pg)};
	ASSERT_EQ(back.size(), ships.size());
	for (size_t i = 0; i < ships.size(); i++) {
		EXPECT_EQ(back[i].ship_id, ships[i].ship_id);
		EXPECT_EQ(back[i].coords, ships[i].coords);
		EXPECT_TRUE(back[i].hits.empty());
	}
}

TEST(Messages, MoveConversion) {
	MoveEvent m{17, 2, {9, 4}, true, false};
	auto pm{pb_obj_from_move(m)};
	EXPECT_EQ(pm.index(), 17u);
	EXPECT_EQ(pm.side(), 2u);
	EXPECT_TRUE(pm.hit());
	EXPECT_FALSE(pm.sunk());
	auto back{move_from_pb_obj(pm)};
	EXPECT_EQ(back.index, m.index);
	EXPECT_EQ(back.side, m.side);
	EXPECT_EQ(back.target, m.target);
	EXPECT_EQ(back.hit, m.hit);
	EXPECT_EQ(back.sunk, m.sunk);
}
