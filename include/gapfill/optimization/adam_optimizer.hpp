#pragma once

#include <Eigen/Dense>

#include <cstddef>

namespace gapfill::optimization {

/**
 * @class AdamOptimizer
 * @brief First-order stochastic optimizer with bias-corrected moment estimates.
 */
class AdamOptimizer {
public:
	struct Options {
		double learning_rate = 0.001;
		double beta1 = 0.9;
		double beta2 = 0.999;
		double epsilon = 1e-7;
		/// Gradients with a larger L2 norm are rescaled to this norm; 0 disables clipping.
		double clip_norm = 5.0;
	};

	AdamOptimizer(std::size_t dimension, Options options);

	/// Applies one update to @p params in place.
	void step(Eigen::VectorXd &params, const Eigen::VectorXd &gradient);

	std::size_t iterations() const noexcept {
		return t_;
	}

private:
	Options options_;
	Eigen::VectorXd m_;
	Eigen::VectorXd v_;
	std::size_t t_ = 0;
};

} // namespace gapfill::optimization
