#include "pheno-index/stats/gam.hpp"

#include "pheno-index/optimization/lbfgs_optimizer.hpp"
#include "pheno-index/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace phenoindex::stats {

namespace {

constexpr double kMuFloor = std::numeric_limits<double>::epsilon();
constexpr double kLogLambdaMin = -10.0;
constexpr double kLogLambdaMax = 16.0;
constexpr double kLogLambdaGridStep = 2.0;
constexpr double kThetaTolerance = 1e-4;

struct Workspace {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	Eigen::MatrixXd S;
	Family family = Family::Poisson;
	GamControl control;
};

struct PenalizedFit {
	Eigen::VectorXd beta;
	Eigen::VectorXd mu;
	double log_lambda = 0.0;
	double deviance = 0.0;
	double edf = 0.0;
	double score = std::numeric_limits<double>::infinity();
	int iterations = 0;
};

Eigen::VectorXd linkInverse(const Eigen::VectorXd &eta) {
	return eta.array().exp().max(kMuFloor).matrix();
}

/// UBRE when the scale is known, GCV otherwise.
double smoothnessScore(Family family, double deviance, double edf, double n) {
	if (hasKnownScale(family)) {
		return deviance / n - 1.0 + 2.0 * edf / n;
	}
	const double residual_df = n - edf;
	if (residual_df <= 0.0) {
		return std::numeric_limits<double>::infinity();
	}
	return n * deviance / (residual_df * residual_df);
}

/// Normal equations of one IRLS step: A = X'WX, b = X'Wz.
struct WorkingSystem {
	Eigen::MatrixXd A;
	Eigen::VectorXd b;
	double zwz = 0.0;
};

WorkingSystem workingSystem(const Workspace &ws, const Eigen::VectorXd &mu, const Eigen::VectorXd &eta, double theta) {
	const Eigen::Index n = ws.y.size();
	Eigen::VectorXd sqrt_w(n);
	Eigen::VectorXd z(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		sqrt_w[i] = std::sqrt(family::workingWeight(ws.family, mu[i], theta));
		z[i] = eta[i] + (ws.y[i] - mu[i]) / mu[i];
	}
	const Eigen::MatrixXd weighted_design = sqrt_w.asDiagonal() * ws.X;
	const Eigen::VectorXd weighted_response = sqrt_w.cwiseProduct(z);

	WorkingSystem system;
	system.A = weighted_design.transpose() * weighted_design;
	system.b = weighted_design.transpose() * weighted_response;
	system.zwz = weighted_response.squaredNorm();
	return system;
}

/// Solves (A + lambda S) beta = b and reports the trace of the influence matrix.
std::optional<std::pair<Eigen::VectorXd, double>> solvePenalized(const WorkingSystem &system,
                                                                 const Eigen::MatrixXd &S, double lambda) {
	const Eigen::MatrixXd H = system.A + lambda * S;
	const Eigen::LLT<Eigen::MatrixXd> llt(H);
	if (llt.info() != Eigen::Success) {
		return std::nullopt;
	}
	Eigen::VectorXd beta = llt.solve(system.b);
	const double edf = llt.solve(system.A).trace();
	if (!beta.allFinite() || !std::isfinite(edf)) {
		return std::nullopt;
	}
	return std::make_pair(std::move(beta), edf);
}

double penalizedDeviance(const Workspace &ws, const Eigen::VectorXd &beta, const Eigen::VectorXd &mu, double theta,
                         double lambda) {
	return family::deviance(ws.family, ws.y, mu, theta) + lambda * beta.dot(ws.S * beta);
}

/// Chooses log(lambda) for the working linear model of one IRLS step.
double selectWorkingLogLambda(const Workspace &ws, const WorkingSystem &system, double start) {
	const double n = static_cast<double>(ws.y.size());
	auto score = [&](double log_lambda) {
		const auto solved = solvePenalized(system, ws.S, std::exp(log_lambda));
		if (!solved) {
			return std::numeric_limits<double>::infinity();
		}
		const Eigen::VectorXd &beta = solved->first;
		const double rss = system.zwz - 2.0 * beta.dot(system.b) + beta.dot(system.A * beta);
		return smoothnessScore(ws.family, std::max(rss, 0.0), solved->second, n);
	};

	double best = start;
	double best_score = score(start);
	for (double rho = kLogLambdaMin; rho <= kLogLambdaMax; rho += kLogLambdaGridStep) {
		const double value = score(rho);
		if (value < best_score) {
			best_score = value;
			best = rho;
		}
	}

	optimization::LBFGSOptimizer::Options options;
	options.max_iterations = 30;
	const double lower = std::max(kLogLambdaMin, best - kLogLambdaGridStep);
	const double upper = std::min(kLogLambdaMax, best + kLogLambdaGridStep);
	const auto refined = optimization::LBFGSOptimizer::minimizeNumeric(
	    [&](const std::vector<double> &x) { return score(x[0]); }, {best}, {lower}, {upper}, options);
	return refined.fx < best_score ? refined.x[0] : best;
}

/**
 * Penalised IRLS. With `fixed_log_lambda` set the smoothing parameter is held;
 * otherwise it is re-selected from the working model at every step.
 */
FitResult<PenalizedFit> penalizedIrls(const Workspace &ws, double theta, std::optional<double> fixed_log_lambda,
                                      const Eigen::VectorXd *mu_start) {
	const Eigen::Index n = ws.y.size();
	const auto &control = ws.control;

	Eigen::VectorXd mu = mu_start ? *mu_start : Eigen::VectorXd((ws.y.array() + 0.1).matrix());
	Eigen::VectorXd eta = mu.array().log().matrix();
	double log_lambda = fixed_log_lambda.value_or(0.0);
	double deviance_old = family::deviance(ws.family, ws.y, mu, theta);
	double penalized_old = std::numeric_limits<double>::infinity();

	Eigen::VectorXd beta_old;
	bool have_previous = false;

	for (int iteration = 1; iteration <= control.max_iterations; ++iteration) {
		const WorkingSystem system = workingSystem(ws, mu, eta, theta);
		if (!fixed_log_lambda) {
			log_lambda = selectWorkingLogLambda(ws, system, log_lambda);
		}
		const double lambda = std::exp(log_lambda);

		auto solved = solvePenalized(system, ws.S, lambda);
		if (!solved) {
			return FitFailure {"Penalised normal equations are not positive definite."};
		}
		Eigen::VectorXd beta = std::move(solved->first);

		eta = ws.X * beta;
		mu = linkInverse(eta);
		double penalized = penalizedDeviance(ws, beta, mu, theta, lambda);

		// Smoothing parameters move between steps in fast mode, so only non-finite steps are halved there.
		auto needs_halving = [&](double value) {
			if (!std::isfinite(value) || !mu.allFinite()) {
				return true;
			}
			return fixed_log_lambda && have_previous && value > penalized_old * (1.0 + 1e-9) + 1e-9;
		};

		int halvings = 0;
		while (needs_halving(penalized)) {
			if (!have_previous || ++halvings > control.max_step_halvings) {
				return FitFailure {"Step halving could not reduce the penalised deviance."};
			}
			beta = 0.5 * (beta + beta_old);
			eta = ws.X * beta;
			mu = linkInverse(eta);
			penalized = penalizedDeviance(ws, beta, mu, theta, lambda);
		}

		const double deviance = family::deviance(ws.family, ws.y, mu, theta);
		const bool converged = fixed_log_lambda
		                           ? std::abs(penalized - penalized_old) < control.tolerance * (std::abs(penalized) + 0.1)
		                           : std::abs(deviance - deviance_old) < control.tolerance * (std::abs(deviance) + 0.1);
		if (converged) {
			const WorkingSystem final_system = workingSystem(ws, mu, eta, theta);
			const auto final_solve = solvePenalized(final_system, ws.S, lambda);
			if (!final_solve) {
				return FitFailure {"Penalised normal equations are not positive definite."};
			}
			PenalizedFit fit;
			fit.beta = std::move(beta);
			fit.mu = std::move(mu);
			fit.log_lambda = log_lambda;
			fit.deviance = deviance;
			fit.edf = final_solve->second;
			fit.score = smoothnessScore(ws.family, deviance, fit.edf, static_cast<double>(n));
			fit.iterations = iteration;
			return fit;
		}

		penalized_old = penalized;
		deviance_old = deviance;
		beta_old = beta;
		have_previous = true;
	}

	return FitFailure {"Penalised IRLS did not converge within " + std::to_string(control.max_iterations) +
	                   " iterations."};
}

/// Outer iteration: score converged fits over log(lambda).
FitResult<PenalizedFit> outerIteration(const Workspace &ws, double theta, const Eigen::VectorXd *mu_start) {
	std::optional<PenalizedFit> best;
	std::string last_failure = "No smoothing parameter produced a converged fit.";

	auto evaluate = [&](double log_lambda) {
		const Eigen::VectorXd *start = best ? &best->mu : mu_start;
		auto outcome = penalizedIrls(ws, theta, log_lambda, start);
		if (auto *failure = std::get_if<FitFailure>(&outcome)) {
			last_failure = failure->reason;
			return std::numeric_limits<double>::infinity();
		}
		auto &fit = std::get<PenalizedFit>(outcome);
		const double score = fit.score;
		if (!best || score < best->score) {
			best = std::move(fit);
		}
		return score;
	};

	for (double rho = kLogLambdaMin; rho <= kLogLambdaMax; rho += kLogLambdaGridStep) {
		evaluate(rho);
	}
	if (!best) {
		return FitFailure {last_failure};
	}

	optimization::LBFGSOptimizer::Options options;
	options.max_iterations = 15;
	const double centre = best->log_lambda;
	const double lower = std::max(kLogLambdaMin, centre - kLogLambdaGridStep);
	const double upper = std::min(kLogLambdaMax, centre + kLogLambdaGridStep);
	optimization::LBFGSOptimizer::minimizeNumeric([&](const std::vector<double> &x) { return evaluate(x[0]); },
	                                              {centre}, {lower}, {upper}, options);
	return *best;
}

FitResult<PenalizedFit> fitWithTheta(const Workspace &ws, double theta, const Eigen::VectorXd *mu_start) {
	if (ws.control.fast) {
		return penalizedIrls(ws, theta, std::nullopt, mu_start);
	}
	return outerIteration(ws, theta, mu_start);
}

} // namespace

GamModel::GamModel(Family family, CubicRegressionSpline spline, Eigen::VectorXd coefficients, std::size_t group_count,
                   double smoothing_parameter, double edf, double deviance, double scale, double theta,
                   int iterations, std::size_t observations)
    : family_(family), spline_(std::move(spline)), coefficients_(std::move(coefficients)), group_count_(group_count),
      smoothing_parameter_(smoothing_parameter), edf_(edf), deviance_(deviance), scale_(scale), theta_(theta),
      iterations_(iterations), observations_(observations) {
}

double GamModel::linearPredictor(double covariate, std::size_t group) const {
	if (group >= group_count_) {
		throw std::out_of_range("GamModel: group level " + std::to_string(group) + " is outside the fitted levels.");
	}
	const Eigen::Index smooth_terms = spline_.dimension() - 1;
	double eta = coefficients_[0] + spline_.constrainedRow(covariate).dot(coefficients_.segment(1, smooth_terms));
	if (group > 0) {
		eta += coefficients_[smooth_terms + static_cast<Eigen::Index>(group)];
	}
	return eta;
}

double GamModel::predict(double covariate, std::size_t group) const {
	return std::exp(linearPredictor(covariate, group));
}

GamFitResult GamSolver::fit(const GamProblem &problem) {
	const std::size_t rows = problem.response.size();
	if (problem.covariate.size() != rows || problem.group.size() != rows) {
		throw std::invalid_argument("GamSolver: covariate, response and group must have the same length.");
	}
	if (problem.group_count == 0) {
		throw std::invalid_argument("GamSolver: at least one group level is required.");
	}

	std::vector<std::size_t> usable;
	usable.reserve(rows);
	for (std::size_t i = 0; i < rows; ++i) {
		if (problem.group[i] >= problem.group_count) {
			throw std::invalid_argument("GamSolver: group level out of range.");
		}
		if (std::isfinite(problem.response[i]) && std::isfinite(problem.covariate[i])) {
			usable.push_back(i);
		}
	}
	if (usable.empty()) {
		return FitFailure {"No observation has a response."};
	}

	std::vector<double> covariate;
	covariate.reserve(usable.size());
	for (auto index : usable) {
		if (problem.response[index] < 0.0) {
			return FitFailure {"Negative counts are not valid for a log-link count model."};
		}
		covariate.push_back(problem.covariate[index]);
	}

	std::optional<CubicRegressionSpline> spline;
	try {
		spline.emplace(covariate, problem.control.basis_dimension);
	} catch (const std::invalid_argument &e) {
		return FitFailure {e.what()};
	}

	const Eigen::Index n = static_cast<Eigen::Index>(usable.size());
	const Eigen::Index smooth_terms = spline->dimension() - 1;
	const Eigen::Index group_terms = static_cast<Eigen::Index>(problem.group_count) - 1;
	const Eigen::Index q = 1 + smooth_terms + group_terms;

	Workspace ws;
	ws.family = problem.family;
	ws.control = problem.control;
	ws.X = Eigen::MatrixXd::Zero(n, q);
	ws.y.resize(n);
	for (Eigen::Index r = 0; r < n; ++r) {
		const std::size_t source = usable[static_cast<std::size_t>(r)];
		ws.X(r, 0) = 1.0;
		ws.X.block(r, 1, 1, smooth_terms) = spline->constrainedRow(problem.covariate[source]);
		if (problem.group[source] > 0) {
			ws.X(r, smooth_terms + static_cast<Eigen::Index>(problem.group[source])) = 1.0;
		}
		ws.y[r] = problem.response[source];
	}

	// Scale the penalty to the design so the log(lambda) search range is data independent.
	const double basis_norm = ws.X.block(0, 1, n, smooth_terms).squaredNorm() / static_cast<double>(n);
	const double penalty_norm = spline->constrainedPenalty().norm();
	const double penalty_scale = penalty_norm > 0.0 ? basis_norm / penalty_norm : 1.0;
	ws.S = Eigen::MatrixXd::Zero(q, q);
	ws.S.block(1, 1, smooth_terms, smooth_terms) = penalty_scale * spline->constrainedPenalty();

	const double infinite_theta = std::numeric_limits<double>::infinity();
	FitResult<PenalizedFit> outcome = FitFailure {"Not fitted."};
	double theta = infinite_theta;

	if (problem.family != Family::NegativeBinomial) {
		outcome = fitWithTheta(ws, infinite_theta, nullptr);
	} else {
		Workspace poisson = ws;
		poisson.family = Family::Poisson;
		outcome = fitWithTheta(poisson, infinite_theta, nullptr);
		for (int alternation = 0; alternation < problem.control.max_theta_iterations && succeeded(outcome);
		     ++alternation) {
			const auto &previous = std::get<PenalizedFit>(outcome);
			const double updated = family::estimateTheta(ws.y, previous.mu);
			const bool stable = std::isfinite(theta) && std::abs(updated - theta) <= kThetaTolerance * theta;
			theta = updated;
			if (stable && alternation > 0) {
				break;
			}
			const Eigen::VectorXd start = previous.mu;
			outcome = fitWithTheta(ws, theta, &start);
		}
	}

	if (auto *failure = std::get_if<FitFailure>(&outcome)) {
		PHENO_DEBUG("GAM ({}) failed: {}", familyName(problem.family), failure->reason);
		return *failure;
	}

	auto &fit = std::get<PenalizedFit>(outcome);
	double scale = 1.0;
	if (problem.family == Family::QuasiPoisson) {
		double chi_square = 0.0;
		for (Eigen::Index i = 0; i < n; ++i) {
			const double residual = ws.y[i] - fit.mu[i];
			chi_square += residual * residual / fit.mu[i];
		}
		const double residual_df = static_cast<double>(n) - fit.edf;
		scale = residual_df > 0.0 ? chi_square / residual_df : std::numeric_limits<double>::quiet_NaN();
	}

	PHENO_DEBUG("GAM ({}, {}) converged: log(lambda) {:.3f}, edf {:.2f}, deviance {:.3f}", familyName(problem.family),
	            problem.control.fast ? "performance iteration" : "outer iteration", fit.log_lambda, fit.edf,
	            fit.deviance);

	return GamModel(problem.family, std::move(*spline), std::move(fit.beta), problem.group_count,
	                std::exp(fit.log_lambda) * penalty_scale, fit.edf, fit.deviance, scale, theta, fit.iterations,
	                static_cast<std::size_t>(n));
}

} // namespace phenoindex::stats
