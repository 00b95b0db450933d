#pragma once

#include "gapfill/transform/transformer.hpp"

namespace gapfill::transform {

/**
 * @class MinMaxScaler
 * @brief Maps [input_min, input_max] linearly onto [output_min, output_max] (default [0, 1]).
 *
 * A constant fitting range maps the constant onto output_min with unit slope.
 * NaNs pass through untouched. Values outside the fitted range are extrapolated.
 */
class MinMaxScaler final : public Transformer {
public:
	MinMaxScaler();

	MinMaxScaler &withScaledRange(double min, double max);
	/// Restores a previously fitted range, e.g. from a persisted artifact.
	MinMaxScaler &withDataRange(double min, double max);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	double transformValue(double value) const override;
	double inverseValue(double value) const override;

	bool isFitted() const noexcept override {
		return has_params_;
	}
	double inputMin() const noexcept {
		return input_min_;
	}
	double inputMax() const noexcept {
		return input_max_;
	}

private:
	void ensureParams() const;
	void computeScale(double input_min, double input_max);

	double output_min_;
	double output_max_;
	bool has_params_;
	double input_min_;
	double input_max_;
	double scale_factor_;
	double offset_;
};

} // namespace gapfill::transform
