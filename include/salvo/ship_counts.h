#ifndef SALVO_SHIP_COUNTS_H
#define SALVO_SHIP_COUNTS_H

#include "salvo/catalog.h"
#include "salvo/config.h"
#include "salvo/errors.h"
#include "salvo/placer.h"
#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <string>

namespace Salvo {

/* Random fleet covering at least random_fill_ratio of the board. */
inline ShipCounts random_ship_counts(size_t width, size_t height,
	std::mt19937& r) {
	auto target{static_cast<size_t>(
		static_cast<double>(width * height) * random_fill_ratio)};
	ShipCounts counts{};
	size_t total{};
	while (total < target) {
		auto i{rrand(r, num_ship_ids)};
		counts[i]++;
		total += catalog[i].tile_count;
	}
	return counts;
}

/* "A,B,C,D,E,F,G", the counts of ids 1..7 */
inline ShipCounts parse_ship_counts(const std::string& list) {
	ShipCounts counts{};
	size_t n{};
	std::istringstream is{list};
	std::string item;
	while (std::getline(is, item, ',')) {
		if (n == num_ship_ids) {
			throw InvalidShipCounts{"expected " + std::to_string(num_ship_ids) +
									" values in \"" + list + "\""};
		}
		if (item.empty() ||
			!std::all_of(item.begin(), item.end(), [](unsigned char c) {
				return std::isdigit(c);
			})) {
			throw InvalidShipCounts{"\"" + item + "\" is not a count"};
		}
		try {
			counts[n++] = std::stoul(item);
		} catch (const std::out_of_range&) {
			throw InvalidShipCounts{"\"" + item + "\" is too large"};
		}
	}
	if ((n != num_ship_ids) || (!list.empty() && (list.back() == ','))) {
		throw InvalidShipCounts{"expected " + std::to_string(num_ship_ids) +
								" values in \"" + list + "\""};
	}
	return counts;
}

/* "[1, 0, 2, 0, 0, 1, 0]" */
inline std::string format_ship_counts(const ShipCounts& counts) {
	std::string r{"["};
	for (size_t i = 0; i < num_ship_ids; i++) {
		r += (i ? ", " : "") + std::to_string(counts[i]);
	}
	return r + "]";
}

} // namespace Salvo

#endif
