#include <catch2/catch_test_macros.hpp>

#include "gapfill/core/time.hpp"

#include <chrono>

using namespace gapfill::core;

TEST_CASE("Timestamps floor to the hour and round-trip through epoch seconds", "[core][time]") {
	const auto tp = fromEpochSeconds(1704067200 + 3 * 3600 + 125);
	REQUIRE(toEpochSeconds(floorToHour(tp)) == 1704067200 + 3 * 3600);
	REQUIRE_FALSE(isHourAligned(tp));
	REQUIRE(isHourAligned(floorToHour(tp)));
	REQUIRE(toEpochSeconds(fromEpochSeconds(1704067200)) == 1704067200);
}

TEST_CASE("Flooring before the epoch rounds towards the past", "[core][time]") {
	REQUIRE(toEpochSeconds(floorToHour(fromEpochSeconds(-1))) == -3600);
	REQUIRE(toEpochSeconds(floorToHour(fromEpochSeconds(-3600))) == -3600);
}

TEST_CASE("Hours between and ISO rendering", "[core][time]") {
	const auto start = fromEpochSeconds(1704067200);
	REQUIRE(hoursBetween(start, start + Hours(5)) == 5);
	REQUIRE(hoursBetween(start, start + std::chrono::minutes(90)) == 1);
	REQUIRE(formatTimestamp(start + Hours(5)) == "2024-01-01T05:00:00Z");
}
