#pragma once

#include <Eigen/Dense>

#include <functional>
#include <string>

namespace gapfill::optimization {

/**
 * @brief Box-constrained L-BFGS minimizer.
 *
 * Wrapper around the LBFGS++ L-BFGS-B solver. Used as the full-batch
 * alternative to Adam when training sequence models; the box keeps weights
 * inside [-bound, bound].
 */
class LBFGSOptimizer {
public:
	/// Computes f(x) and writes the gradient into the second argument.
	using Objective = std::function<double(const Eigen::VectorXd &, Eigen::VectorXd &)>;

	struct Result {
		Eigen::VectorXd x;
		double fx = 0.0;
		int iterations = 0;
		bool converged = false;
		std::string message;
	};

	struct Options {
		int max_iterations;
		double epsilon;
		int m; // L-BFGS memory
		double ftol;
		int max_linesearch;

		Options() : max_iterations(200), epsilon(1e-6), m(10), ftol(1e-6), max_linesearch(20) {
		}
	};

	static Result minimize(const Objective &objective, const Eigen::VectorXd &x0, const Eigen::VectorXd &lower,
	                       const Eigen::VectorXd &upper, const Options &options = Options());

	/// Same bound on every coordinate.
	static Result minimize(const Objective &objective, const Eigen::VectorXd &x0, double bound,
	                       const Options &options = Options());
};

} // namespace gapfill::optimization
