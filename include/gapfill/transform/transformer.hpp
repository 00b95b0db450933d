#pragma once

#include <vector>

namespace gapfill::transform {

/**
 * @class Transformer
 * @brief Invertible per-value transform between sensor units and model units.
 *
 * Fitted once on a training split; the fitted state travels with the model
 * artifact so that inference applies exactly the same mapping.
 */
class Transformer {
public:
	virtual ~Transformer() = default;

	virtual void fit(const std::vector<double> &data) = 0;
	virtual bool isFitted() const noexcept = 0;

	virtual double transformValue(double value) const = 0;
	virtual double inverseValue(double value) const = 0;

	/// In-place forms; NaN entries (missing hours) are left as they are.
	virtual void transform(std::vector<double> &data) const = 0;
	virtual void inverseTransform(std::vector<double> &data) const = 0;
};

} // namespace gapfill::transform
