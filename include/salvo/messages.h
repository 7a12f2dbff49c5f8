#ifndef SALVO_MESSAGES_H
#define SALVO_MESSAGES_H

#include "battle.pb.h"
#include "salvo/battle.h"
#include "salvo/game.h"
#include "salvo/wrapped_posix.h"
#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Salvo {

/* 4-byte big-endian length followed by the message */
inline std::string serialize(const Messages::Wire& pbmsg) {
	std::string r(sizeof(uint32_t), '\0');
	pbmsg.AppendToString(&r);
	uint32_t len{htonl(static_cast<uint32_t>(r.length() - sizeof(uint32_t)))};
	std::memcpy(r.data(), &len, sizeof(len));
	return r;
}

inline Messages::Grid pb_obj_from_ships(
	int side, const Grid& board, const std::vector<ShipInstance>& ships) {
	Messages::Grid pg;
	pg.set_side(side);
	pg.set_rows(board.rows());
	pg.set_cols(board.cols());
	for (const auto& ship : ships) {
		auto ps{pg.add_ships()};
		ps->set_ship_id(ship.ship_id);
		for (const auto& point : sorted_points(ship.coords)) {
			auto pp{ps->add_points()};
			pp->set_x(point.x);
			pp->set_y(point.y);
		}
	}
	return pg;
}

inline std::vector<ShipInstance> ships_from_pb_obj(const Messages::Grid& pg) {
	std::vector<ShipInstance> ships;
	for (const auto& pship : pg.ships()) {
		std::unordered_set<Point> points;
		for (const auto& ppoint : pship.points()) {
			points.insert({ppoint.x(), ppoint.y()});
		}
		ships.push_back({static_cast<Cell>(pship.ship_id()), std::move(points), {}});
	}
	return ships;
}

/* ship-id grid of a side, rebuilt from its ships */
inline Grid grid_from_pb_obj(const Messages::Grid& pg) {
	Grid g{pg.rows(), pg.cols()};
	for (const auto& pship : pg.ships()) {
		for (const auto& ppoint : pship.points()) {
			g.set({ppoint.x(), ppoint.y()}, static_cast<Cell>(pship.ship_id()));
		}
	}
	return g;
}

inline Messages::Move pb_obj_from_move(const MoveEvent& m) {
	Messages::Move pm;
	pm.set_index(m.index);
	pm.set_side(m.side);
	pm.set_x(m.target.x);
	pm.set_y(m.target.y);
	pm.set_hit(m.hit);
	pm.set_sunk(m.sunk);
	return pm;
}

inline MoveEvent move_from_pb_obj(const Messages::Move& pm) {
	return MoveEvent{pm.index(), static_cast<int>(pm.side()),
		Point{pm.x(), pm.y()}, pm.hit(), pm.sunk()};
}

/* Reads length-prefixed messages from a file. next() returns false at a
 * clean end of file. */
class RecordReader {
	FileDescriptor file;

	/* false if the file ended before the first byte */
	bool read_exactly(char* buf, size_t n) {
		size_t received{};
		while (received < n) {
			auto r{read(file, buf + received, n - received)};
			if (r < 0) {
				if (errno == EINTR) {
					continue;
				}
				throw PosixException{"Could not read record"};
			}
			if (r == 0) {
				if (received == 0) {
					return false;
				}
				throw std::runtime_error{"Truncated record"};
			}
			received += r;
		}
		return true;
	}

	public:
	RecordReader(const std::string& path)
		: file{open_for_reading(path), path} {}
	bool next(Messages::Wire& msg) {
		uint32_t incoming_length{};
		if (!read_exactly(reinterpret_cast<char*>(&incoming_length),
				sizeof(incoming_length))) {
			return false;
		}
		incoming_length = ntohl(incoming_length);
		std::string buf(incoming_length, '\0');
		if ((incoming_length > 0) && !read_exactly(buf.data(), buf.length())) {
			throw std::runtime_error{"Truncated record"};
		}
		msg.Clear();
		if (!msg.ParseFromString(buf)) {
			throw std::runtime_error{"Could not parse record"};
		}
		return true;
	}
};

} // namespace Salvo

#endif
