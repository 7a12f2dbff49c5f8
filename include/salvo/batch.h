#ifndef SALVO_BATCH_H
#define SALVO_BATCH_H

#include "salvo/battle.h"
#include "salvo/battle_log.h"
#include "salvo/config.h"
#include "salvo/statistics.h"
#include "salvo/wrapped_posix.h"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace Salvo {

struct BatchOptions {
	size_t battles{1};
	uint32_t seed{};
	size_t threads{1};
	bool verbose{};
	// empty for no log files
	std::string log_root;
};

/* odd battles are opened by player 1, even ones by player 2 */
inline int starting_side(size_t battle) { return (battle % 2 == 1) ? 1 : 2; }

/* every battle gets its own generators, derived from the base seed */
inline uint32_t battle_seed(uint32_t base, size_t battle) {
	return base + static_cast<uint32_t>(battle * 2);
}

struct BattleOutcome {
	BattleSummary summary{};
	std::string report; // verbose output, empty otherwise
};

/* Plays battle number n (1-based) with default players. */
inline BattleOutcome play_battle(
	const BattleConfig& c, size_t n, const BatchOptions& o) {
	Battle battle{c, battle_seed(o.seed, n)};
	std::vector<std::unique_ptr<BattleObserver>> sinks;
	if (!o.log_root.empty()) {
		auto dir{o.log_root + "/battle_" + std::to_string(n)};
		make_directories(dir);
		sinks.push_back(std::make_unique<TextLog>(dir + "/battle_log.txt"));
		sinks.push_back(std::make_unique<RecordWriter>(dir + "/battle.rec"));
	}
	std::ostringstream report;
	if (o.verbose) {
		sinks.push_back(std::make_unique<MoveReporter>(report, &battle));
	}
	for (auto& s : sinks) {
		battle.add_observer(*s);
	}
	auto side{starting_side(n)};
	if (o.verbose) {
		report << "\n=== Battle " << n << " (Player " << side
			   << " starts) ===\n";
	}
	BattleOutcome outcome{battle.run(side), {}};
	if (o.verbose) {
		report << "Battle " << n << " finished: "
			   << ((outcome.summary.winner == 0)
						  ? std::string{"Draw"}
						  : "Winner: Player " +
								std::to_string(outcome.summary.winner))
			   << " in " << outcome.summary.moves << " moves.\n";
		outcome.report = report.str();
	}
	return outcome;
}

/* Runs o.battles independent battles on up to o.threads threads. Results are
 * collected by battle number, so output and totals do not depend on which
 * thread finishes first. The first failing battle's exception is rethrown. */
inline Statistics run_batch(
	const BattleConfig& c, const BatchOptions& o, std::ostream& out) {
	std::vector<BattleOutcome> outcomes(o.battles);
	std::vector<std::exception_ptr> errors(o.battles);
	auto threads{std::max<size_t>(o.threads, 1)};
	size_t n{1};
	while (n <= o.battles) {
		std::vector<std::thread> batch;
		auto batch_size{std::min(threads, o.battles - n + 1)};
		for (size_t i = 0; i < batch_size; ++i, ++n) {
			batch.emplace_back([&c, &o, &outcomes, &errors, n]() {
				try {
					outcomes[n - 1] = play_battle(c, n, o);
				} catch (...) {
					errors[n - 1] = std::current_exception();
				}
			});
		}
		for (auto& t : batch) {
			t.join();
		}
	}
	Statistics stats;
	for (size_t i = 0; i < o.battles; i++) {
		if (errors[i]) {
			std::rethrow_exception(errors[i]);
		}
		out << outcomes[i].report;
		stats.record(outcomes[i].summary);
	}
	return stats;
}

} // namespace Salvo

#endif
