#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace gapfill::utils {

struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> r_squared;
	std::size_t n = 0;

	/// R² with an undefined value (constant actuals) reported as zero.
	double r2OrZero() const {
		return r_squared.value_or(0.0);
	}

	static AccuracyMetrics compute(const std::vector<double> &actual, const std::vector<double> &predicted);
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double errorStdDev(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace gapfill::utils
