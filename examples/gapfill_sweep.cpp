#include "gapfill/engine.hpp"
#include "gapfill/sweep/sweep_runner.hpp"
#include "gapfill/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace gapfill;

namespace {

const core::TimePoint kStart = core::fromEpochSeconds(1704067200); // 2024-01-01T00:00:00Z

// Two weeks of a daily PM2.5 cycle with a few dropouts: one short, one medium, one long.
void seedStation(store::SqliteReadingStore &readings, const std::string &station, std::uint32_t seed) {
	readings.addStation(station);
	std::mt19937 rng(seed);
	std::uniform_real_distribution<double> noise(-1.5, 1.5);
	const int hours = 24 * 14;
	for (int h = 0; h < hours; ++h) {
		const bool dropped = (h >= 200 && h < 202) || (h >= 260 && h < 272) || (h >= 300 && h < 330);
		core::ReadingUpsert upsert;
		upsert.station_id = station;
		upsert.timestamp = kStart + core::Hours(h);
		if (dropped) {
			upsert.values[core::Parameter::PM25] = std::nullopt;
		} else {
			upsert.values[core::Parameter::PM25] = 35.0 + 12.0 * std::sin(2.0 * M_PI * h / 24.0) + noise(rng);
		}
		readings.upsertReading(upsert);
	}
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printSummary(const sweep::SweepSummary &summary) {
	for (const auto &station : summary.stations) {
		std::cout << std::left << std::setw(12) << station.station_id << std::setw(12)
		          << sweep::stationStatusName(station.status) << station.message << "\n";
	}
	std::cout << "succeeded=" << summary.succeeded << " failed=" << summary.failed << " skipped=" << summary.skipped
	          << " cancelled=" << summary.cancelled << "\n";
}

} // namespace

int main(int argc, char **argv) {
	const std::string path = argc > 1 ? argv[1] : ":memory:";

	auto config = core::EngineConfig::fromEnvironment();
	config.trainer.units_1 = 16;
	config.trainer.units_2 = 8;
	config.trainer.max_epochs = 40;
	config.sweep.workers = 2;
	config.imputer.fallback = core::FallbackMethod::LinearInterpolation;

	try {
		auto engine = std::make_shared<Engine>(path, config);
		seedStation(*engine->readings(), "north", 7);
		seedStation(*engine->readings(), "harbour", 11);
		engine->readings()->addStation("new-site");

		sweep::SweepRunner runner(engine, config.sweep);
		const auto end = kStart + core::Hours(24 * 14 - 1);

		printHeader("Gaps at north");
		for (const auto &gap : engine->detectGaps("north", kStart, end)) {
			std::cout << core::formatTimestamp(gap.start) << " .. " << core::formatTimestamp(gap.end) << "  "
			          << gap.hours() << "h " << core::durationClassName(gap.duration_class) << "\n";
		}

		printHeader("Training");
		printSummary(runner.trainAll({}));

		printHeader("Validation");
		printSummary(runner.validateAll({}));

		printHeader("Gap fill");
		printSummary(runner.fillGaps({}, kStart, end));
	} catch (const std::exception &e) {
		std::cerr << "gapfill_sweep: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
