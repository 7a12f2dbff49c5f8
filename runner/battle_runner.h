#ifndef SALVO_RUNNER_BATTLE_RUNNER_H
#define SALVO_RUNNER_BATTLE_RUNNER_H

#include "salvo/batch.h"
#include "salvo/battle.h"
#include "salvo/catalog.h"
#include "salvo/config.h"
#include "salvo/errors.h"
#include "salvo/ship_counts.h"
#include "salvo/statistics.h"
#include "salvo/wrapped_posix.h"
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

class UsageError : public std::invalid_argument {
	public:
	UsageError(const std::string& m) : std::invalid_argument{m} {}
};

class Runner {
	Salvo::BattleConfig config;
	Salvo::BatchOptions options;
	std::optional<Salvo::ShipCounts> fixed_counts;
	std::string run_dir;

	/* logs/battle_log_20260101_120000, one per run */
	static std::string run_directory(const std::string& root) {
		Salvo::make_directories(root);
		auto now{std::time(nullptr)};
		std::tm local{};
		if (localtime_r(&now, &local) == nullptr) {
			throw Salvo::PosixException{"Could not read the local time"};
		}
		char stamp[32]{};
		std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
		return Salvo::make_unique_directory(root + "/battle_log_" + stamp);
	}

	static size_t number(const char* arg, char opt, size_t min) {
		std::string s{arg};
		size_t pos{};
		unsigned long long v{};
		try {
			v = std::stoull(s, &pos);
		} catch (const std::exception&) {
			pos = 0;
		}
		if ((pos == 0) || (pos != s.length()) || (v < min) ||
			(s.front() == '-')) {
			throw UsageError{std::string{"Option -"} + opt +
							 " expects a number of at least " +
							 std::to_string(min) + ", got \"" + s + "\""};
		}
		return v;
	}

	public:
	static constexpr const char* usage{
		"usage: salvo_runner [-v] [-c COUNT] [-W WIDTH] [-H HEIGHT] "
		"[-l A,B,C,D,E,F,G] [-s SEED] [-j THREADS] [-o LOGDIR] [-n]"};

	Runner(int argc, char** argv) {
		std::random_device rd;
		options.seed = rd();
		options.threads = std::thread::hardware_concurrency();
		if (options.threads == 0) {
			options.threads = 4;
		}
		options.log_root = Salvo::default_log_root;
		bool no_logs{false};
		optind = 1;
		int opt{};
		while ((opt = getopt(argc, argv, "vc:W:H:l:s:j:o:n")) != -1) {
			switch (opt) {
			case 'v':
				options.verbose = true;
				break;
			case 'c':
				options.battles = number(optarg, opt, 1);
				break;
			case 'W':
				config.cols = number(optarg, opt, 1);
				break;
			case 'H':
				config.rows = number(optarg, opt, 1);
				break;
			case 'l':
				fixed_counts = Salvo::parse_ship_counts(optarg);
				break;
			case 's':
				options.seed = static_cast<uint32_t>(number(optarg, opt, 0));
				break;
			case 'j':
				options.threads = number(optarg, opt, 1);
				break;
			case 'o':
				options.log_root = optarg;
				break;
			case 'n':
				no_logs = true;
				break;
			default:
				throw UsageError{usage};
			}
		}
		if (optind < argc) {
			throw UsageError{usage};
		}
		if (no_logs) {
			options.log_root.clear();
		}
	}

	int run() {
		if (fixed_counts) {
			config.ship_counts = *fixed_counts;
		} else {
			std::mt19937 r{options.seed};
			config.ship_counts =
				Salvo::random_ship_counts(config.cols, config.rows, r);
			if (options.verbose) {
				std::cout << "Random ship counts generated: "
						  << Salvo::format_ship_counts(config.ship_counts)
						  << "\n";
			}
		}
		// fail before starting any battle
		Salvo::check_ship_counts(config.ship_counts);
		auto required{Salvo::required_tiles(config.ship_counts)};
		if (required > config.rows * config.cols) {
			throw Salvo::InsufficientSpace{required, config.rows * config.cols};
		}
		auto batch{options};
		if (!options.log_root.empty()) {
			run_dir = run_directory(options.log_root);
			batch.log_root = run_dir;
			if (options.verbose) {
				std::cout << "Logging to " << run_dir << "\n";
			}
		}
		auto stats{Salvo::run_batch(config, batch, std::cout)};
		std::cout << "\n" << stats;
		return EXIT_SUCCESS;
	}

	const Salvo::BattleConfig& battle_config() const { return config; }
	const Salvo::BatchOptions& batch_options() const { return options; }
	bool random_fleet() const { return !fixed_counts; }
	/* directory of the last run's logs, empty without logs */
	const std::string& log_dir() const { return run_dir; }
};

#endif
