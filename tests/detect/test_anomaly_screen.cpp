#include <catch2/catch_test_macros.hpp>

#include "gapfill/detect/anomaly_screen.hpp"

#include "common/store_fixtures.hpp"

using namespace gapfill;
using tests::helpers::hour;

namespace {

core::HourlySeries hourly(const std::vector<double> &values) {
	core::HourlySeries series;
	for (std::size_t i = 0; i < values.size(); ++i) {
		series.push_back({hour(static_cast<int>(i)), values[i], false});
	}
	return series;
}

std::size_t countKind(const std::vector<detect::AnomalyFlag> &flags, detect::AnomalyKind kind) {
	std::size_t n = 0;
	for (const auto &flag : flags) {
		n += flag.kind == kind ? 1 : 0;
	}
	return n;
}

} // namespace

TEST_CASE("Smooth series pass the screen", "[detect][anomaly]") {
	detect::AnomalyScreen screen;
	REQUIRE_FALSE(screen.hasAnomaly(hourly({12.0, 13.5, 12.8, 14.0, 15.1, 14.7})));
	REQUIRE(screen.screen({}).empty());
}

TEST_CASE("Spikes relative to the previous hour are flagged", "[detect][anomaly]") {
	detect::AnomalyScreen screen;
	const auto flags = screen.screen(hourly({10.0, 10.5, 55.0, 11.0}));
	REQUIRE(countKind(flags, detect::AnomalyKind::Spike) == 1);
	const auto &spike = flags.front();
	REQUIRE(spike.timestamp == hour(2));
	REQUIRE(spike.previous_value == 10.5);

	// A near-zero previous value is raised to the minimum base.
	REQUIRE_FALSE(screen.hasAnomaly(hourly({0.01, 2.0})));
}

TEST_CASE("Negative values and fast changes are flagged", "[detect][anomaly]") {
	core::AnomalyConfig config;
	config.max_rate_per_hour = 5.0;
	detect::AnomalyScreen screen(config);

	const auto flags = screen.screen(hourly({3.0, -1.0, 2.0, 9.0}));
	REQUIRE(countKind(flags, detect::AnomalyKind::Negative) == 1);
	REQUIRE(countKind(flags, detect::AnomalyKind::Rate) == 1);
	REQUIRE(flags.back().timestamp == hour(3));
}

TEST_CASE("A run of identical values is flagged as stuck", "[detect][anomaly]") {
	core::AnomalyConfig config;
	config.stuck_run_hours = 4;
	detect::AnomalyScreen screen(config);

	REQUIRE(countKind(screen.screen(hourly({8.0, 8.0, 8.0, 9.0, 8.0})), detect::AnomalyKind::Stuck) == 0);
	const auto flags = screen.screen(hourly({7.0, 8.0, 8.0, 8.0, 8.0, 9.0}));
	REQUIRE(countKind(flags, detect::AnomalyKind::Stuck) == 4);
	REQUIRE(flags.front().timestamp == hour(1));

	// Identical values across a missing hour are not one run.
	core::HourlySeries broken = hourly({8.0, 8.0, 8.0, 8.0});
	broken[2].timestamp = hour(5);
	broken[3].timestamp = hour(6);
	REQUIRE(countKind(screen.screen(broken), detect::AnomalyKind::Stuck) == 0);
}

TEST_CASE("Invalid screening thresholds are rejected", "[detect][anomaly]") {
	core::AnomalyConfig config;
	config.spike_factor = 0.5;
	REQUIRE_THROWS_AS(detect::AnomalyScreen(config), std::invalid_argument);
}
