#include <catch2/catch_test_macros.hpp>

#include "gapfill/training/windowing.hpp"

#include "common/store_fixtures.hpp"

using namespace gapfill;
using tests::helpers::hour;

namespace {

core::HourlySeries run(int first_hour, std::size_t length, double first_value) {
	core::HourlySeries series;
	for (std::size_t i = 0; i < length; ++i) {
		series.push_back({hour(first_hour + static_cast<int>(i)), first_value + static_cast<double>(i), false});
	}
	return series;
}

} // namespace

TEST_CASE("Windows slide within each contiguous run", "[training][windowing]") {
	const auto windows = training::buildWindows({run(0, 5, 0.0)}, 3);

	REQUIRE(windows.size() == 2);
	REQUIRE(windows.inputs.cols() == 3);
	REQUIRE(windows.inputs(0, 0) == 0.0);
	REQUIRE(windows.inputs(0, 2) == 2.0);
	REQUIRE(windows.targets(0) == 3.0);
	REQUIRE(windows.targets(1) == 4.0);
	REQUIRE(windows.target_times[1] == hour(4));
}

TEST_CASE("Windows never bridge a gap and short runs contribute nothing", "[training][windowing]") {
	const auto later = run(100, 6, 100.0);
	const auto short_run = run(50, 3, 50.0);
	const auto earlier = run(0, 4, 0.0);

	const auto windows = training::buildWindows({later, short_run, earlier}, 3);
	REQUIRE(windows.size() == 4);
	REQUIRE(windows.target_times.front() == hour(3));
	REQUIRE(windows.target_times[1] == hour(103));
	for (Eigen::Index row = 0; row < windows.inputs.rows(); ++row) {
		REQUIRE(windows.targets(row) - windows.inputs(row, 0) == 3.0);
	}

	REQUIRE(training::buildWindows({short_run}, 3).size() == 0);
	REQUIRE_THROWS_AS(training::buildWindows({earlier}, 0), std::invalid_argument);
}

TEST_CASE("Window sets can be sliced and selected", "[training][windowing]") {
	const auto windows = training::buildWindows({run(0, 10, 0.0)}, 2);
	REQUIRE(windows.size() == 8);

	const auto middle = windows.slice(2, 3);
	REQUIRE(middle.size() == 3);
	REQUIRE(middle.targets(0) == 4.0);
	REQUIRE_THROWS_AS(windows.slice(6, 3), std::out_of_range);

	const auto picked = windows.select({7, 0});
	REQUIRE(picked.targets(0) == 9.0);
	REQUIRE(picked.targets(1) == 2.0);
	REQUIRE(picked.target_times[0] == hour(9));
	REQUIRE_THROWS_AS(windows.select({8}), std::out_of_range);
}

TEST_CASE("Chronological split keeps later windows for validation", "[training][windowing]") {
	const auto windows = training::buildWindows({run(0, 12, 0.0)}, 2);
	REQUIRE(windows.size() == 10);

	const auto split = training::splitChronologically(windows, 0.2);
	REQUIRE(split.training.size() == 8);
	REQUIRE(split.validation.size() == 2);
	REQUIRE(split.training.target_times.back() < split.validation.target_times.front());

	const auto tiny = training::splitChronologically(windows.slice(0, 2), 0.01);
	REQUIRE(tiny.training.size() == 1);
	REQUIRE(tiny.validation.size() == 1);

	REQUIRE_THROWS_AS(training::splitChronologically(windows.slice(0, 1), 0.2), std::invalid_argument);
	REQUIRE_THROWS_AS(training::splitChronologically(windows, 1.0), std::invalid_argument);
}
