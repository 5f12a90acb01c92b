#include "pheno-index/optimization/lbfgs_optimizer.hpp"

#include "pheno-index/utils/logging.hpp"

#include <Eigen/Core>
#include <LBFGSB.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace phenoindex::optimization {

using namespace LBFGSpp;

namespace {

// Stand-in for non-finite objective values so the line search backs off instead of failing.
constexpr double kInfeasibleValue = 1e100;

} // namespace

void LBFGSOptimizer::projectBounds(std::vector<double> &x, const std::vector<double> &lower,
                                   const std::vector<double> &upper) {
	for (std::size_t i = 0; i < x.size(); ++i) {
		x[i] = std::max(lower[i], std::min(x[i], upper[i]));
	}
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const std::vector<double> &x0,
                                                const std::vector<double> &lower, const std::vector<double> &upper,
                                                const Options &options) {
	if (x0.empty() || lower.size() != x0.size() || upper.size() != x0.size()) {
		throw std::invalid_argument("LBFGSOptimizer: start point and bounds must be non-empty and equal length.");
	}
	for (std::size_t i = 0; i < x0.size(); ++i) {
		if (!(lower[i] <= upper[i])) {
			throw std::invalid_argument("LBFGSOptimizer: lower bound exceeds upper bound.");
		}
	}

	const int n = static_cast<int>(x0.size());

	Result result;
	result.converged = false;
	result.iterations = 0;
	result.evaluations = 0;
	result.x = x0;
	projectBounds(result.x, lower, upper);
	result.fx = std::numeric_limits<double>::infinity();

	Eigen::VectorXd x = Eigen::VectorXd::Map(result.x.data(), n);
	const Eigen::VectorXd lb = Eigen::VectorXd::Map(lower.data(), n);
	const Eigen::VectorXd ub = Eigen::VectorXd::Map(upper.data(), n);

	LBFGSBParam<double> param;
	param.max_iterations = options.max_iterations;
	param.epsilon = options.epsilon;
	param.epsilon_rel = options.epsilon;
	param.m = options.m;
	param.ftol = options.ftol;
	param.wolfe = 0.9;
	param.max_linesearch = 30;

	LBFGSBSolver<double> solver(param);

	std::vector<double> x_vec(n);
	std::vector<double> grad_vec(n);
	auto eigen_objective = [&](const Eigen::VectorXd &x_eigen, Eigen::VectorXd &grad_eigen) {
		for (int i = 0; i < n; ++i) {
			x_vec[i] = x_eigen[i];
			grad_vec[i] = 0.0;
		}

		double fx = objective(x_vec, grad_vec);
		++result.evaluations;
		if (!std::isfinite(fx)) {
			fx = kInfeasibleValue;
		}
		if (fx < result.fx) {
			result.fx = fx;
			result.x = x_vec;
		}

		for (int i = 0; i < n; ++i) {
			grad_eigen[i] = std::isfinite(grad_vec[i]) ? grad_vec[i] : 0.0;
		}
		return fx;
	};

	double fx = 0.0;
	try {
		result.iterations = solver.minimize(eigen_objective, x, fx, lb, ub);
		result.converged = true;
		result.message = "Converged";
		PHENO_DEBUG("L-BFGS-B converged in {} iterations, f = {}", result.iterations, fx);
	} catch (const std::exception &e) {
		result.converged = false;
		result.message = std::string("Stopped: ") + e.what();
		PHENO_DEBUG("L-BFGS-B stopped after {} evaluations: {}", result.evaluations, e.what());
	}

	projectBounds(result.x, lower, upper);
	return result;
}

LBFGSOptimizer::Result LBFGSOptimizer::minimizeNumeric(const ValueObjective &objective, const std::vector<double> &x0,
                                                       const std::vector<double> &lower,
                                                       const std::vector<double> &upper, const Options &options) {
	const double relative_step = options.finite_difference_step;
	auto with_gradient = [&](const std::vector<double> &x, std::vector<double> &grad) {
		const double fx = objective(x);
		std::vector<double> probe = x;
		for (std::size_t i = 0; i < x.size(); ++i) {
			const double h = relative_step * std::max(1.0, std::abs(x[i]));
			const double forward = std::min(x[i] + h, upper[i]);
			const double backward = std::max(x[i] - h, lower[i]);
			if (forward <= backward) {
				grad[i] = 0.0;
				continue;
			}
			probe[i] = forward;
			const double f_forward = objective(probe);
			probe[i] = backward;
			const double f_backward = objective(probe);
			probe[i] = x[i];
			grad[i] = (f_forward - f_backward) / (forward - backward);
		}
		return fx;
	};
	return minimize(with_gradient, x0, lower, upper, options);
}

} // namespace phenoindex::optimization
