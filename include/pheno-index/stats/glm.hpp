#pragma once

#include "pheno-index/stats/family.hpp"

#include <Eigen/Dense>
#include <cstddef>

namespace phenoindex::stats {

struct GlmControl {
	int max_iterations = 25;
	double tolerance = 1e-8;
	int max_step_halvings = 20;
	int max_theta_iterations = 25;
};

/**
 * @brief Log-link regression problem with a prior offset.
 *
 * Rows whose response is NaN or whose offset is not finite are left out of
 * the fit. The design may have zero columns; the fitted mean is then
 * exp(offset).
 */
struct GlmProblem {
	Eigen::MatrixXd design;
	Eigen::VectorXd response;
	Eigen::VectorXd offset;
	Family family = Family::QuasiPoisson;
	GlmControl control;
};

/**
 * @class GlmModel
 * @brief Fitted coefficients of a log-link GLM.
 */
class GlmModel {
public:
	GlmModel(Family family, Eigen::VectorXd coefficients, double deviance, double dispersion, double theta,
	         int iterations, std::size_t observations);

	/// exp(design * coefficients + offset); NaN wherever the offset is NaN.
	Eigen::VectorXd predict(const Eigen::MatrixXd &design, const Eigen::VectorXd &offset) const;

	Family family() const {
		return family_;
	}
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}
	double deviance() const {
		return deviance_;
	}
	/// Pearson dispersion (1 for Poisson).
	double dispersion() const {
		return dispersion_;
	}
	/// Negative binomial size; infinity for the other families.
	double theta() const {
		return theta_;
	}
	int iterations() const {
		return iterations_;
	}
	std::size_t observations() const {
		return observations_;
	}

private:
	Family family_;
	Eigen::VectorXd coefficients_;
	double deviance_;
	double dispersion_;
	double theta_;
	int iterations_;
	std::size_t observations_;
};

using GlmFitResult = FitResult<GlmModel>;

/**
 * @class IGlmSolver
 * @brief Offset regression engine used for per-site abundance models.
 */
class IGlmSolver {
public:
	virtual ~IGlmSolver() = default;

	/**
	 * @brief Fits the problem, returning the model or the reason it failed.
	 *
	 * Numerical trouble is reported as a FitFailure, never thrown.
	 */
	virtual GlmFitResult fit(const GlmProblem &problem) = 0;
};

/**
 * @class GlmSolver
 * @brief Iteratively reweighted least squares with step halving.
 *
 * Quasi-Poisson reports the Pearson dispersion; the negative binomial
 * alternates IRLS with maximum-likelihood estimation of its size.
 */
class GlmSolver final : public IGlmSolver {
public:
	GlmFitResult fit(const GlmProblem &problem) override;
};

} // namespace phenoindex::stats
