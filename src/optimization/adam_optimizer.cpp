#include "gapfill/optimization/adam_optimizer.hpp"

#include <cmath>
#include <stdexcept>

namespace gapfill::optimization {

AdamOptimizer::AdamOptimizer(std::size_t dimension, Options options)
    : options_(options), m_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(dimension))),
      v_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(dimension))) {
	if (!(options_.learning_rate > 0.0)) {
		throw std::invalid_argument("Adam learning rate must be positive.");
	}
	if (options_.beta1 < 0.0 || options_.beta1 >= 1.0 || options_.beta2 < 0.0 || options_.beta2 >= 1.0) {
		throw std::invalid_argument("Adam betas must lie in [0, 1).");
	}
}

void AdamOptimizer::step(Eigen::VectorXd &params, const Eigen::VectorXd &gradient) {
	if (params.size() != m_.size() || gradient.size() != m_.size()) {
		throw std::invalid_argument("Adam parameter and gradient sizes must match the optimizer dimension.");
	}

	Eigen::VectorXd g = gradient;
	if (options_.clip_norm > 0.0) {
		const double norm = g.norm();
		if (norm > options_.clip_norm) {
			g *= options_.clip_norm / norm;
		}
	}

	++t_;
	m_ = options_.beta1 * m_ + (1.0 - options_.beta1) * g;
	v_ = options_.beta2 * v_ + (1.0 - options_.beta2) * g.cwiseAbs2();

	const double bias1 = 1.0 - std::pow(options_.beta1, static_cast<double>(t_));
	const double bias2 = 1.0 - std::pow(options_.beta2, static_cast<double>(t_));
	const double step_size = options_.learning_rate * std::sqrt(bias2) / bias1;

	params.array() -= step_size * m_.array() / (v_.array().sqrt() + options_.epsilon);
}

} // namespace gapfill::optimization
