#ifndef SALVO_CONFIG_H
#define SALVO_CONFIG_H

#include <array>
#include <cstddef>

namespace Salvo {

constexpr size_t default_width{10}, default_height{10};
constexpr size_t num_ship_ids{7};

// probability multiplier for neighbours of a fresh hit
constexpr double hit_boost{2.0};
// a battle is a draw after rows * cols * draw_multiplier moves
constexpr size_t draw_multiplier{100};
// global restarts of the placer before giving up
constexpr size_t max_placement_restarts{1000};
// random fleets cover at least this share of the board
constexpr double random_fill_ratio{0.3};

constexpr const char* default_log_root{"logs"};

// ship_counts[i] is the number of ships with id i + 1
using ShipCounts = std::array<size_t, num_ship_ids>;

struct BattleConfig {
	size_t rows{default_height};
	size_t cols{default_width};
	ShipCounts ship_counts{};
};

} // namespace Salvo

#endif
