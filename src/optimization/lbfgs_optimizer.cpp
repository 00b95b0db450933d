#include "gapfill/optimization/lbfgs_optimizer.hpp"

#include "gapfill/utils/logging.hpp"

#include <LBFGSB.h>

#include <stdexcept>

namespace gapfill::optimization {

using namespace LBFGSpp;

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const Eigen::VectorXd &x0,
                                                const Eigen::VectorXd &lower, const Eigen::VectorXd &upper,
                                                const Options &options) {
	if (lower.size() != x0.size() || upper.size() != x0.size()) {
		throw std::invalid_argument("LBFGSOptimizer bounds must match the parameter dimension.");
	}

	Result result;
	Eigen::VectorXd x = x0.cwiseMax(lower).cwiseMin(upper);

	LBFGSBParam<double> param;
	param.max_iterations = options.max_iterations;
	param.epsilon = options.epsilon;
	param.epsilon_rel = options.epsilon;
	param.m = options.m;
	param.ftol = options.ftol;
	param.wolfe = 0.9;
	param.max_linesearch = options.max_linesearch;

	LBFGSBSolver<double> solver(param);
	auto eigen_objective = [&objective](const Eigen::VectorXd &point, Eigen::VectorXd &grad) {
		return objective(point, grad);
	};

	double fx = 0.0;
	try {
		result.iterations = solver.minimize(eigen_objective, x, fx, lower, upper);
		result.converged = result.iterations < options.max_iterations;
		result.message = result.converged ? "Converged" : "Iteration limit reached";
		GAPFILL_DEBUG("[LBFGS] {} after {} iterations, f = {}", result.message, result.iterations, fx);
	} catch (const std::exception &e) {
		// Line search failures (runtime_error or logic_error) leave x at the last accepted iterate.
		result.converged = false;
		result.message = std::string("Failed: ") + e.what();
		Eigen::VectorXd grad(x.size());
		fx = objective(x, grad);
		GAPFILL_DEBUG("[LBFGS] {}", result.message);
	}

	result.x = x.cwiseMax(lower).cwiseMin(upper);
	result.fx = fx;
	return result;
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const Eigen::VectorXd &x0, double bound,
                                                const Options &options) {
	if (!(bound > 0.0)) {
		throw std::invalid_argument("LBFGSOptimizer bound must be positive.");
	}
	const Eigen::VectorXd upper = Eigen::VectorXd::Constant(x0.size(), bound);
	return minimize(objective, x0, -upper, upper, options);
}

} // namespace gapfill::optimization
