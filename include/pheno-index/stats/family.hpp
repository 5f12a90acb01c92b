#pragma once

#include <Eigen/Dense>
#include <string>
#include <string_view>
#include <variant>

namespace phenoindex::stats {

/**
 * @brief Error distribution of a count regression. All families use the log link.
 */
enum class Family {
	Poisson,
	NegativeBinomial,
	QuasiPoisson
};

/**
 * @brief Parses "poisson", "nb"/"negbin"/"negative_binomial" or "quasipoisson" (any case).
 * @throws core::InputContractError for any other name.
 */
Family parseFamily(std::string_view name);
std::string familyName(Family family);

/// Poisson is the only family with a scale parameter fixed at one.
inline bool hasKnownScale(Family family) {
	return family == Family::Poisson;
}

/**
 * @brief Explicit failure of a regression fit.
 */
struct FitFailure {
	std::string reason;
};

/**
 * @brief Either a usable fitted model or the reason the fit failed.
 */
template <typename Model>
using FitResult = std::variant<Model, FitFailure>;

template <typename Model>
bool succeeded(const FitResult<Model> &result) {
	return std::holds_alternative<Model>(result);
}

namespace family {

/// Variance function V(mu); theta is only read for the negative binomial.
double variance(Family family, double mu, double theta);

/// IRLS working weight for the log link, mu^2 / V(mu).
double workingWeight(Family family, double mu, double theta);

double unitDeviance(Family family, double y, double mu, double theta);

double deviance(Family family, const Eigen::VectorXd &y, const Eigen::VectorXd &mu, double theta);

/// Pearson chi-square over n - p degrees of freedom.
double pearsonDispersion(Family family, const Eigen::VectorXd &y, const Eigen::VectorXd &mu, double theta,
                         int parameters);

/// Negative binomial log-likelihood of y given mean mu and size theta.
double negativeBinomialLogLikelihood(const Eigen::VectorXd &y, const Eigen::VectorXd &mu, double theta);

/**
 * @brief Maximum-likelihood negative binomial size for fixed means.
 *
 * Optimises log(theta) with bounded L-BFGS, starting from a moment estimate.
 */
double estimateTheta(const Eigen::VectorXd &y, const Eigen::VectorXd &mu);

} // namespace family

} // namespace phenoindex::stats
