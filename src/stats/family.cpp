#include "pheno-index/stats/family.hpp"

#include "pheno-index/core/errors.hpp"
#include "pheno-index/optimization/lbfgs_optimizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace phenoindex::stats {

namespace {

constexpr double kMinTheta = 1e-4;
constexpr double kMaxTheta = 1e8;

double yLogYOverMu(double y, double mu) {
	return y > 0.0 ? y * std::log(y / mu) : 0.0;
}

} // namespace

Family parseFamily(std::string_view name) {
	std::string lowered(name);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "poisson") {
		return Family::Poisson;
	}
	if (lowered == "nb" || lowered == "negbin" || lowered == "negative_binomial") {
		return Family::NegativeBinomial;
	}
	if (lowered == "quasipoisson") {
		return Family::QuasiPoisson;
	}
	throw core::InputContractError("Unsupported model family '" + std::string(name) +
	                               "'; expected poisson, nb or quasipoisson.");
}

std::string familyName(Family family) {
	switch (family) {
	case Family::Poisson:
		return "poisson";
	case Family::NegativeBinomial:
		return "nb";
	case Family::QuasiPoisson:
		return "quasipoisson";
	}
	return "unknown";
}

namespace family {

double variance(Family family, double mu, double theta) {
	if (family == Family::NegativeBinomial) {
		return mu + mu * mu / theta;
	}
	return mu;
}

double workingWeight(Family family, double mu, double theta) {
	if (family == Family::NegativeBinomial) {
		return mu / (1.0 + mu / theta);
	}
	return mu;
}

double unitDeviance(Family family, double y, double mu, double theta) {
	if (family == Family::NegativeBinomial) {
		return 2.0 * (yLogYOverMu(y, mu) - (y + theta) * std::log((y + theta) / (mu + theta)));
	}
	return 2.0 * (yLogYOverMu(y, mu) - (y - mu));
}

double deviance(Family family, const Eigen::VectorXd &y, const Eigen::VectorXd &mu, double theta) {
	double total = 0.0;
	for (Eigen::Index i = 0; i < y.size(); ++i) {
		total += unitDeviance(family, y[i], mu[i], theta);
	}
	return total;
}

double pearsonDispersion(Family family, const Eigen::VectorXd &y, const Eigen::VectorXd &mu, double theta,
                         int parameters) {
	const Eigen::Index residual_df = y.size() - parameters;
	if (residual_df <= 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	double chi_square = 0.0;
	for (Eigen::Index i = 0; i < y.size(); ++i) {
		const double residual = y[i] - mu[i];
		chi_square += residual * residual / variance(family, mu[i], theta);
	}
	return chi_square / static_cast<double>(residual_df);
}

double negativeBinomialLogLikelihood(const Eigen::VectorXd &y, const Eigen::VectorXd &mu, double theta) {
	double total = 0.0;
	for (Eigen::Index i = 0; i < y.size(); ++i) {
		total += std::lgamma(y[i] + theta) - std::lgamma(theta) - std::lgamma(y[i] + 1.0) +
		         theta * std::log(theta) - (y[i] + theta) * std::log(theta + mu[i]);
		if (y[i] > 0.0) {
			total += y[i] * std::log(mu[i]);
		}
	}
	return total;
}

double estimateTheta(const Eigen::VectorXd &y, const Eigen::VectorXd &mu) {
	const Eigen::Index n = y.size();
	double spread = 0.0;
	for (Eigen::Index i = 0; i < n; ++i) {
		const double ratio = y[i] / mu[i] - 1.0;
		spread += ratio * ratio;
	}
	double start = spread > 0.0 ? static_cast<double>(n) / spread : kMaxTheta;
	start = std::clamp(start, kMinTheta, kMaxTheta);

	auto negative_log_likelihood = [&](const std::vector<double> &log_theta) {
		return -negativeBinomialLogLikelihood(y, mu, std::exp(log_theta[0]));
	};

	optimization::LBFGSOptimizer::Options options;
	options.max_iterations = 50;
	const auto result = optimization::LBFGSOptimizer::minimizeNumeric(
	    negative_log_likelihood, {std::log(start)}, {std::log(kMinTheta)}, {std::log(kMaxTheta)}, options);
	return std::exp(result.x[0]);
}

} // namespace family

} // namespace phenoindex::stats
