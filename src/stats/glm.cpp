#include "pheno-index/stats/glm.hpp"

#include "pheno-index/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace phenoindex::stats {

namespace {

constexpr double kMuFloor = std::numeric_limits<double>::epsilon();
constexpr double kThetaTolerance = 1e-5;

struct IrlsState {
	Eigen::VectorXd beta;
	Eigen::VectorXd mu;
	double deviance = 0.0;
	int iterations = 0;
};

Eigen::VectorXd linkInverse(const Eigen::VectorXd &eta) {
	return eta.array().exp().max(kMuFloor).matrix();
}

FitResult<IrlsState> runIrls(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const Eigen::VectorXd &offset,
                             Family family, double theta, const GlmControl &control, const Eigen::VectorXd *mu_start) {
	const Eigen::Index n = y.size();
	const Eigen::Index p = X.cols();

	IrlsState state;
	if (p == 0) {
		state.beta = Eigen::VectorXd(0);
		state.mu = linkInverse(offset);
		state.deviance = family::deviance(family, y, state.mu, theta);
		if (!std::isfinite(state.deviance)) {
			return FitFailure {"Deviance of the offset-only model is not finite."};
		}
		return state;
	}

	Eigen::VectorXd mu = mu_start ? *mu_start : Eigen::VectorXd((y.array() + 0.1).matrix());
	Eigen::VectorXd eta = mu.array().log().matrix();
	double deviance_old = family::deviance(family, y, mu, theta);

	Eigen::VectorXd beta_old;
	bool have_previous = false;

	for (int iteration = 1; iteration <= control.max_iterations; ++iteration) {
		Eigen::VectorXd sqrt_w(n);
		Eigen::VectorXd z(n);
		for (Eigen::Index i = 0; i < n; ++i) {
			sqrt_w[i] = std::sqrt(family::workingWeight(family, mu[i], theta));
			z[i] = eta[i] - offset[i] + (y[i] - mu[i]) / mu[i];
		}

		const Eigen::MatrixXd weighted_design = sqrt_w.asDiagonal() * X;
		const Eigen::VectorXd weighted_response = sqrt_w.cwiseProduct(z);
		const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(weighted_design);
		if (qr.rank() < p) {
			return FitFailure {"Design matrix is rank deficient (rank " + std::to_string(qr.rank()) + " < " +
			                   std::to_string(p) + ")."};
		}

		Eigen::VectorXd beta = qr.solve(weighted_response);
		if (!beta.allFinite()) {
			return FitFailure {"Weighted least squares produced non-finite coefficients."};
		}

		eta = X * beta + offset;
		mu = linkInverse(eta);
		double deviance = family::deviance(family, y, mu, theta);

		int halvings = 0;
		while (!std::isfinite(deviance) || !mu.allFinite()) {
			if (!have_previous || ++halvings > control.max_step_halvings) {
				return FitFailure {"Non-finite deviance that step halving could not correct."};
			}
			beta = 0.5 * (beta + beta_old);
			eta = X * beta + offset;
			mu = linkInverse(eta);
			deviance = family::deviance(family, y, mu, theta);
		}

		if (std::abs(deviance - deviance_old) / (std::abs(deviance) + 0.1) < control.tolerance) {
			state.beta = std::move(beta);
			state.mu = std::move(mu);
			state.deviance = deviance;
			state.iterations = iteration;
			return state;
		}

		deviance_old = deviance;
		beta_old = beta;
		have_previous = true;
	}

	return FitFailure {"IRLS did not converge within " + std::to_string(control.max_iterations) + " iterations."};
}

} // namespace

GlmModel::GlmModel(Family family, Eigen::VectorXd coefficients, double deviance, double dispersion, double theta,
                   int iterations, std::size_t observations)
    : family_(family), coefficients_(std::move(coefficients)), deviance_(deviance), dispersion_(dispersion),
      theta_(theta), iterations_(iterations), observations_(observations) {
}

Eigen::VectorXd GlmModel::predict(const Eigen::MatrixXd &design, const Eigen::VectorXd &offset) const {
	if (design.cols() != coefficients_.size()) {
		throw std::invalid_argument("GlmModel::predict: design has " + std::to_string(design.cols()) +
		                            " columns, model has " + std::to_string(coefficients_.size()) + " coefficients.");
	}
	if (design.rows() != offset.size()) {
		throw std::invalid_argument("GlmModel::predict: design and offset lengths differ.");
	}
	Eigen::VectorXd eta = offset;
	if (coefficients_.size() > 0) {
		eta += design * coefficients_;
	}
	return eta.array().exp().matrix();
}

GlmFitResult GlmSolver::fit(const GlmProblem &problem) {
	const Eigen::Index rows = problem.response.size();
	if (problem.design.rows() != rows || problem.offset.size() != rows) {
		throw std::invalid_argument("GlmSolver: design, response and offset must have the same number of rows.");
	}

	std::vector<Eigen::Index> usable;
	usable.reserve(static_cast<std::size_t>(rows));
	for (Eigen::Index i = 0; i < rows; ++i) {
		if (std::isfinite(problem.response[i]) && std::isfinite(problem.offset[i])) {
			usable.push_back(i);
		}
	}
	if (usable.empty()) {
		return FitFailure {"No observation has both a response and a finite offset."};
	}

	const Eigen::Index n = static_cast<Eigen::Index>(usable.size());
	const Eigen::Index p = problem.design.cols();
	Eigen::MatrixXd X(n, p);
	Eigen::VectorXd y(n);
	Eigen::VectorXd offset(n);
	for (Eigen::Index r = 0; r < n; ++r) {
		const Eigen::Index source = usable[static_cast<std::size_t>(r)];
		if (p > 0) {
			X.row(r) = problem.design.row(source);
		}
		y[r] = problem.response[source];
		offset[r] = problem.offset[source];
	}
	if ((y.array() < 0.0).any()) {
		return FitFailure {"Negative counts are not valid for a log-link count model."};
	}

	const auto &control = problem.control;
	const double poisson_theta = std::numeric_limits<double>::infinity();

	if (problem.family != Family::NegativeBinomial) {
		auto outcome = runIrls(X, y, offset, problem.family, poisson_theta, control, nullptr);
		if (auto *failure = std::get_if<FitFailure>(&outcome)) {
			return *failure;
		}
		auto &state = std::get<IrlsState>(outcome);
		const double dispersion =
		    problem.family == Family::QuasiPoisson
		        ? family::pearsonDispersion(problem.family, y, state.mu, poisson_theta, static_cast<int>(p))
		        : 1.0;
		PHENO_DEBUG("GLM ({}) converged after {} iterations, deviance {:.4f}", familyName(problem.family),
		            state.iterations, state.deviance);
		return GlmModel(problem.family, std::move(state.beta), state.deviance, dispersion, poisson_theta,
		                state.iterations, static_cast<std::size_t>(n));
	}

	auto initial = runIrls(X, y, offset, Family::Poisson, poisson_theta, control, nullptr);
	if (auto *failure = std::get_if<FitFailure>(&initial)) {
		return *failure;
	}
	IrlsState state = std::get<IrlsState>(std::move(initial));
	double theta = family::estimateTheta(y, state.mu);
	int total_iterations = state.iterations;

	for (int alternation = 0; alternation < control.max_theta_iterations; ++alternation) {
		auto outcome = runIrls(X, y, offset, Family::NegativeBinomial, theta, control, &state.mu);
		if (auto *failure = std::get_if<FitFailure>(&outcome)) {
			return *failure;
		}
		state = std::get<IrlsState>(std::move(outcome));
		total_iterations += state.iterations;

		const double updated = family::estimateTheta(y, state.mu);
		const bool stable = std::abs(updated - theta) <= kThetaTolerance * theta;
		theta = updated;
		if (stable) {
			break;
		}
	}
	if (!std::isfinite(theta)) {
		return FitFailure {"Negative binomial size estimate is not finite."};
	}

	state.deviance = family::deviance(Family::NegativeBinomial, y, state.mu, theta);
	PHENO_DEBUG("GLM (nb) finished with theta {:.4f} after {} IRLS iterations", theta, total_iterations);
	return GlmModel(Family::NegativeBinomial, std::move(state.beta), state.deviance, 1.0, theta, total_iterations,
	                static_cast<std::size_t>(n));
}

} // namespace phenoindex::stats
