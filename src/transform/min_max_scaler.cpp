#include "gapfill/transform/min_max_scaler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace gapfill::transform {

MinMaxScaler::MinMaxScaler()
	: output_min_(0.0), output_max_(1.0), has_params_(false),
	  input_min_(0.0), input_max_(1.0), scale_factor_(1.0), offset_(0.0) {
}

MinMaxScaler &MinMaxScaler::withScaledRange(double min, double max) {
	if (!(max > min)) {
		throw std::invalid_argument("MinMaxScaler output range must satisfy min < max.");
	}
	output_min_ = min;
	output_max_ = max;
	if (has_params_) {
		computeScale(input_min_, input_max_);
	}
	return *this;
}

MinMaxScaler &MinMaxScaler::withDataRange(double min, double max) {
	if (!std::isfinite(min) || !std::isfinite(max) || max < min) {
		throw std::invalid_argument("MinMaxScaler data range must be finite with min <= max.");
	}
	input_min_ = min;
	input_max_ = max;
	has_params_ = true;
	computeScale(min, max);
	return *this;
}

void MinMaxScaler::fit(const std::vector<double> &data) {
	double min_val = std::numeric_limits<double>::max();
	double max_val = std::numeric_limits<double>::lowest();

	for (double value : data) {
		if (!std::isnan(value)) {
			min_val = std::min(min_val, value);
			max_val = std::max(max_val, value);
		}
	}

	if (min_val == std::numeric_limits<double>::max()) {
		throw std::invalid_argument("MinMaxScaler cannot be fitted without finite values.");
	}

	input_min_ = min_val;
	input_max_ = max_val;
	has_params_ = true;
	computeScale(input_min_, input_max_);
}

void MinMaxScaler::transform(std::vector<double> &data) const {
	ensureParams();
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = scale_factor_ * value + offset_;
	}
}

void MinMaxScaler::inverseTransform(std::vector<double> &data) const {
	ensureParams();
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = (value - offset_) / scale_factor_;
	}
}

double MinMaxScaler::transformValue(double value) const {
	ensureParams();
	return scale_factor_ * value + offset_;
}

double MinMaxScaler::inverseValue(double value) const {
	ensureParams();
	return (value - offset_) / scale_factor_;
}

void MinMaxScaler::ensureParams() const {
	if (!has_params_) {
		throw std::runtime_error("MinMaxScaler must be fitted before transform");
	}
}

void MinMaxScaler::computeScale(double input_min, double input_max) {
	if (std::abs(input_max - input_min) < std::numeric_limits<double>::epsilon()) {
		// Constant data
		scale_factor_ = 1.0;
		offset_ = output_min_ - input_min;
	} else {
		scale_factor_ = (output_max_ - output_min_) / (input_max - input_min);
		offset_ = output_min_ - scale_factor_ * input_min;
	}
}

} // namespace gapfill::transform
