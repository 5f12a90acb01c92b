#pragma once

#include <Eigen/Dense>
#include <vector>

namespace phenoindex::stats {

/**
 * @class CubicRegressionSpline
 * @brief Penalised cubic regression spline parameterised by its values at the knots.
 *
 * Knots sit at evenly spaced positions through the sorted unique covariate
 * values. The wiggliness penalty is the integrated squared second derivative.
 * A sum-to-zero constraint over the covariate values used for construction is
 * absorbed by a QR reparameterisation, leaving `dimension() - 1` free
 * coefficients. Outside the knot range the curve continues linearly.
 */
class CubicRegressionSpline {
public:
	/**
	 * @brief Builds the basis from covariate values.
	 * @param covariate Values of the smoothed covariate (duplicates allowed).
	 * @param basis_dimension Requested number of knots; reduced to the number of unique values.
	 * @throws std::invalid_argument if fewer than three unique values are available.
	 */
	CubicRegressionSpline(const std::vector<double> &covariate, int basis_dimension);

	static std::vector<double> placeKnots(std::vector<double> covariate, int knot_count);

	int dimension() const {
		return static_cast<int>(knots_.size());
	}
	const Eigen::VectorXd &knots() const {
		return knots_;
	}

	/// Unconstrained basis row (length dimension()).
	Eigen::RowVectorXd basisRow(double x) const;
	/// Constrained basis row (length dimension() - 1).
	Eigen::RowVectorXd constrainedRow(double x) const;
	Eigen::MatrixXd constrainedBasis(const std::vector<double> &x) const;

	/// Unconstrained penalty D' B^-1 D.
	const Eigen::MatrixXd &penalty() const {
		return penalty_;
	}
	/// Penalty in the constrained parameterisation, Z' S Z.
	const Eigen::MatrixXd &constrainedPenalty() const {
		return constrained_penalty_;
	}
	/// Null space of the sum-to-zero constraint (dimension() x dimension() - 1).
	const Eigen::MatrixXd &constraintNullSpace() const {
		return null_space_;
	}

private:
	Eigen::RowVectorXd derivativeRow(double x, Eigen::Index interval) const;
	Eigen::Index intervalOf(double x) const;

	Eigen::VectorXd knots_;
	Eigen::MatrixXd second_derivative_map_;  // knot values -> second derivatives at knots
	Eigen::MatrixXd penalty_;
	Eigen::MatrixXd null_space_;
	Eigen::MatrixXd constrained_penalty_;
};

} // namespace phenoindex::stats
