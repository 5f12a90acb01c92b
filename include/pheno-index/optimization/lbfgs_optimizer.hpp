#pragma once

#include <functional>
#include <string>
#include <vector>

namespace phenoindex::optimization {

/**
 * @brief Box-constrained L-BFGS minimiser.
 *
 * Wrapper around the LBFGS++ L-BFGS-B solver. Used to pick smoothing
 * parameters on the log scale and to estimate the negative binomial size
 * parameter. The best point evaluated is returned even when the line search
 * gives up, so a failed run never leaves the caller worse off than `x0`.
 */
class LBFGSOptimizer {
public:
	struct Result {
		std::vector<double> x;    // Best parameters found
		double fx;                // Objective at x
		int iterations;           // Solver iterations
		int evaluations;          // Objective evaluations
		bool converged;           // Solver reported convergence
		std::string message;      // Status message
	};

	struct Options {
		int max_iterations;
		double epsilon;                 // Gradient norm tolerance
		int m;                          // Number of corrections
		double ftol;                    // Sufficient decrease for the line search
		double finite_difference_step;  // Relative step for numeric gradients

		Options() : max_iterations(100), epsilon(1e-6), m(6), ftol(1e-4), finite_difference_step(1e-5) {
		}
	};

	using Objective = std::function<double(const std::vector<double> &, std::vector<double> &)>;
	using ValueObjective = std::function<double(const std::vector<double> &)>;

	/**
	 * @brief Minimise an objective that supplies its own gradient.
	 *
	 * @param objective Computes f(x) and writes the gradient into its second argument.
	 * @param x0 Starting point, projected onto the bounds.
	 * @param lower Lower bound for each parameter.
	 * @param upper Upper bound for each parameter.
	 */
	static Result minimize(const Objective &objective, const std::vector<double> &x0, const std::vector<double> &lower,
	                       const std::vector<double> &upper, const Options &options = Options());

	/**
	 * @brief Minimise an objective using central finite-difference gradients kept inside the bounds.
	 */
	static Result minimizeNumeric(const ValueObjective &objective, const std::vector<double> &x0,
	                              const std::vector<double> &lower, const std::vector<double> &upper,
	                              const Options &options = Options());

private:
	static void projectBounds(std::vector<double> &x, const std::vector<double> &lower,
	                          const std::vector<double> &upper);
};

} // namespace phenoindex::optimization
