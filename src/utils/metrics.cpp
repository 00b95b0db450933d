#include "gapfill/utils/metrics.hpp"

#include <Eigen/Dense>
#include <string>

namespace gapfill::utils {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

/// predicted - actual, after checking that both sides line up.
Eigen::VectorXd residuals(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty() || actual.size() != predicted.size()) {
		throw std::invalid_argument("Metrics need non-empty actual and predicted series of equal length (got " +
		                            std::to_string(actual.size()) + " and " + std::to_string(predicted.size()) + ").");
	}
	const auto n = static_cast<Eigen::Index>(actual.size());
	return ConstVectorMap(predicted.data(), n) - ConstVectorMap(actual.data(), n);
}

} // namespace

AccuracyMetrics AccuracyMetrics::compute(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const Eigen::VectorXd errors = residuals(actual, predicted);
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = errors.cwiseAbs().mean();
	metrics.mse = errors.squaredNorm() / static_cast<double>(errors.size());
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.r_squared = Metrics::r2(actual, predicted);
	return metrics;
}

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return residuals(actual, predicted).cwiseAbs().mean();
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const Eigen::VectorXd errors = residuals(actual, predicted);
	return errors.squaredNorm() / static_cast<double>(errors.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const Eigen::VectorXd errors = residuals(actual, predicted);
	const ConstVectorMap observed(actual.data(), static_cast<Eigen::Index>(actual.size()));
	const double total = (observed.array() - observed.mean()).square().sum();
	// Constant observations leave the explained share undefined.
	if (total < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return 1.0 - errors.squaredNorm() / total;
}

double Metrics::bias(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return residuals(actual, predicted).mean();
}

double Metrics::errorStdDev(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const Eigen::VectorXd errors = residuals(actual, predicted);
	const Eigen::ArrayXd centered = errors.array() - errors.mean();
	return std::sqrt(centered.square().mean());
}

} // namespace gapfill::utils
