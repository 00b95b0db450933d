#include <catch2/catch_test_macros.hpp>

#include "gapfill/transform/min_max_scaler.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace gapfill::transform;

namespace {

bool approxEqual(double lhs, double rhs, double eps = 1e-9) {
	if (std::isnan(lhs) && std::isnan(rhs)) {
		return true;
	}
	return std::fabs(lhs - rhs) <= eps;
}

void expectSeriesEqual(const std::vector<double> &lhs, const std::vector<double> &rhs) {
	REQUIRE(lhs.size() == rhs.size());
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		REQUIRE(approxEqual(lhs[i], rhs[i]));
	}
}

} // namespace

TEST_CASE("MinMaxScaler maps the fitted range onto [0, 1]", "[transform][scaler]") {
	std::vector<double> data{10.0, 20.0, std::numeric_limits<double>::quiet_NaN(), 30.0};
	MinMaxScaler scaler;
	scaler.fit(data);
	scaler.transform(data);

	expectSeriesEqual(data, {0.0, 0.5, std::numeric_limits<double>::quiet_NaN(), 1.0});
	REQUIRE(scaler.inputMin() == 10.0);
	REQUIRE(scaler.inputMax() == 30.0);

	scaler.inverseTransform(data);
	expectSeriesEqual(data, {10.0, 20.0, std::numeric_limits<double>::quiet_NaN(), 30.0});
}

TEST_CASE("MinMaxScaler extrapolates outside the fitted range", "[transform][scaler]") {
	MinMaxScaler scaler;
	scaler.fit({0.0, 10.0});
	REQUIRE(approxEqual(scaler.transformValue(15.0), 1.5));
	REQUIRE(approxEqual(scaler.inverseValue(-0.5), -5.0));
}

TEST_CASE("MinMaxScaler refits on new data", "[transform][scaler]") {
	MinMaxScaler scaler;
	scaler.fit({0.0, 10.0});
	scaler.fit({100.0, 200.0});
	REQUIRE(approxEqual(scaler.transformValue(150.0), 0.5));
}

TEST_CASE("MinMaxScaler restores a persisted range", "[transform][scaler]") {
	MinMaxScaler scaler;
	scaler.withScaledRange(-1.0, 1.0).withDataRange(0.0, 50.0);
	REQUIRE(scaler.isFitted());
	REQUIRE(approxEqual(scaler.transformValue(25.0), 0.0));
	REQUIRE(approxEqual(scaler.inverseValue(1.0), 50.0));
	REQUIRE_THROWS_AS(MinMaxScaler().withDataRange(5.0, 1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(MinMaxScaler().withScaledRange(1.0, 1.0), std::invalid_argument);
}

TEST_CASE("MinMaxScaler handles constant data with unit slope", "[transform][scaler]") {
	MinMaxScaler scaler;
	scaler.fit({42.0, 42.0, 42.0});
	REQUIRE(approxEqual(scaler.transformValue(42.0), 0.0));
	REQUIRE(approxEqual(scaler.transformValue(43.0), 1.0));
	REQUIRE(approxEqual(scaler.inverseValue(0.25), 42.25));
}

TEST_CASE("MinMaxScaler requires fitting before use", "[transform][scaler]") {
	MinMaxScaler scaler;
	REQUIRE_FALSE(scaler.isFitted());
	REQUIRE_THROWS_AS(scaler.transformValue(1.0), std::runtime_error);
	REQUIRE_THROWS_AS(scaler.fit({std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
}
