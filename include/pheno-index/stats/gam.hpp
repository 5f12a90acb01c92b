#pragma once

#include "pheno-index/stats/cubic_regression_spline.hpp"
#include "pheno-index/stats/family.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace phenoindex::stats {

struct GamControl {
	int max_iterations = 200;
	double tolerance = 1e-7;
	int max_step_halvings = 25;
	int basis_dimension = 10;
	int max_theta_iterations = 10;
	/// Performance iteration (smoothing parameter re-selected at every IRLS step) instead of outer iteration.
	bool fast = false;
};

/**
 * @brief count ~ s(covariate) + group, log link.
 *
 * `group` holds a level index in [0, group_count) per row. With more than one
 * level the levels enter as treatment contrasts against level 0. Rows whose
 * response is NaN are left out of the fit.
 */
struct GamProblem {
	std::vector<double> covariate;
	std::vector<double> response;
	std::vector<std::size_t> group;
	std::size_t group_count = 1;
	Family family = Family::Poisson;
	GamControl control;
};

/**
 * @class GamModel
 * @brief Fitted smooth seasonal curve with additive group effects on the log scale.
 */
class GamModel {
public:
	GamModel(Family family, CubicRegressionSpline spline, Eigen::VectorXd coefficients, std::size_t group_count,
	         double smoothing_parameter, double edf, double deviance, double scale, double theta, int iterations,
	         std::size_t observations);

	/// Expected count at `covariate` for group level `group`.
	double predict(double covariate, std::size_t group) const;
	/// Linear predictor (log scale).
	double linearPredictor(double covariate, std::size_t group) const;

	Family family() const {
		return family_;
	}
	const CubicRegressionSpline &spline() const {
		return spline_;
	}
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}
	std::size_t groupCount() const {
		return group_count_;
	}
	double smoothingParameter() const {
		return smoothing_parameter_;
	}
	/// Effective degrees of freedom of the whole model.
	double edf() const {
		return edf_;
	}
	double deviance() const {
		return deviance_;
	}
	double scale() const {
		return scale_;
	}
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
	CubicRegressionSpline spline_;
	Eigen::VectorXd coefficients_;
	std::size_t group_count_;
	double smoothing_parameter_;
	double edf_;
	double deviance_;
	double scale_;
	double theta_;
	int iterations_;
	std::size_t observations_;
};

using GamFitResult = FitResult<GamModel>;

/**
 * @class ICurveSolver
 * @brief Smoothing regression engine used to estimate seasonal flight curves.
 */
class ICurveSolver {
public:
	virtual ~ICurveSolver() = default;

	/**
	 * @brief Fits the problem, returning the model or the reason it failed.
	 *
	 * Numerical trouble is reported as a FitFailure, never thrown.
	 */
	virtual GamFitResult fit(const GamProblem &problem) = 0;
};

/**
 * @class GamSolver
 * @brief Penalised IRLS for a cubic regression spline plus group effects.
 *
 * The smoothing parameter minimises UBRE for Poisson and GCV otherwise.
 * Standard mode scores fully converged fits over log(lambda): a coarse grid
 * followed by bounded L-BFGS refinement. Fast mode applies the same search to
 * the working linear model inside every IRLS step, which needs a single
 * penalised IRLS run. The negative binomial alternates the fit with
 * maximum-likelihood estimation of its size.
 */
class GamSolver final : public ICurveSolver {
public:
	GamFitResult fit(const GamProblem &problem) override;
};

} // namespace phenoindex::stats
