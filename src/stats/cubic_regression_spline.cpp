#include "pheno-index/stats/cubic_regression_spline.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace phenoindex::stats {

std::vector<double> CubicRegressionSpline::placeKnots(std::vector<double> covariate, int knot_count) {
	std::sort(covariate.begin(), covariate.end());
	covariate.erase(std::unique(covariate.begin(), covariate.end()), covariate.end());

	const std::size_t n = covariate.size();
	if (knot_count < 2 || static_cast<std::size_t>(knot_count) > n) {
		throw std::invalid_argument("CubicRegressionSpline: cannot place " + std::to_string(knot_count) +
		                            " knots over " + std::to_string(n) + " unique values.");
	}

	std::vector<double> knots(static_cast<std::size_t>(knot_count));
	knots.front() = covariate.front();
	knots.back() = covariate.back();

	const double delta = static_cast<double>(n - 1) / static_cast<double>(knot_count - 1);
	for (int i = 1; i < knot_count - 1; ++i) {
		const double position = delta * static_cast<double>(i);
		const auto lower = static_cast<std::size_t>(std::floor(position));
		const double fraction = position - static_cast<double>(lower);
		const std::size_t upper = std::min(lower + 1, n - 1);
		knots[static_cast<std::size_t>(i)] = covariate[lower] * (1.0 - fraction) + covariate[upper] * fraction;
	}
	return knots;
}

CubicRegressionSpline::CubicRegressionSpline(const std::vector<double> &covariate, int basis_dimension) {
	std::vector<double> unique_values = covariate;
	std::sort(unique_values.begin(), unique_values.end());
	unique_values.erase(std::unique(unique_values.begin(), unique_values.end()), unique_values.end());
	if (unique_values.size() < 3) {
		throw std::invalid_argument("CubicRegressionSpline: at least three unique covariate values are required.");
	}

	const int k = std::min(basis_dimension, static_cast<int>(unique_values.size()));
	if (k < 3) {
		throw std::invalid_argument("CubicRegressionSpline: basis dimension must be at least 3.");
	}

	const auto placed = placeKnots(unique_values, k);
	knots_ = Eigen::VectorXd::Map(placed.data(), k);

	Eigen::VectorXd h(k - 1);
	for (int j = 0; j < k - 1; ++j) {
		h[j] = knots_[j + 1] - knots_[j];
	}

	Eigen::MatrixXd D = Eigen::MatrixXd::Zero(k - 2, k);
	Eigen::MatrixXd B = Eigen::MatrixXd::Zero(k - 2, k - 2);
	for (int i = 0; i < k - 2; ++i) {
		D(i, i) = 1.0 / h[i];
		D(i, i + 1) = -1.0 / h[i] - 1.0 / h[i + 1];
		D(i, i + 2) = 1.0 / h[i + 1];
		B(i, i) = (h[i] + h[i + 1]) / 3.0;
		if (i < k - 3) {
			B(i, i + 1) = h[i + 1] / 6.0;
			B(i + 1, i) = h[i + 1] / 6.0;
		}
	}

	const Eigen::MatrixXd b_inverse_d = B.ldlt().solve(D);
	second_derivative_map_ = Eigen::MatrixXd::Zero(k, k);
	second_derivative_map_.block(1, 0, k - 2, k) = b_inverse_d;
	penalty_ = D.transpose() * b_inverse_d;

	Eigen::VectorXd column_sums = Eigen::VectorXd::Zero(k);
	for (double x : covariate) {
		column_sums += basisRow(x).transpose();
	}
	const Eigen::HouseholderQR<Eigen::MatrixXd> qr{Eigen::MatrixXd(column_sums)};
	const Eigen::MatrixXd q = qr.householderQ() * Eigen::MatrixXd::Identity(k, k);
	null_space_ = q.rightCols(k - 1);
	constrained_penalty_ = null_space_.transpose() * penalty_ * null_space_;
}

Eigen::Index CubicRegressionSpline::intervalOf(double x) const {
	const auto begin = knots_.data();
	const auto end = knots_.data() + knots_.size();
	const Eigen::Index upper = std::upper_bound(begin, end, x) - begin;
	return std::clamp<Eigen::Index>(upper - 1, 0, knots_.size() - 2);
}

Eigen::RowVectorXd CubicRegressionSpline::derivativeRow(double x, Eigen::Index j) const {
	const double h = knots_[j + 1] - knots_[j];
	const double right = knots_[j + 1] - x;
	const double left = x - knots_[j];

	Eigen::RowVectorXd row = Eigen::RowVectorXd::Zero(knots_.size());
	row[j] = -1.0 / h;
	row[j + 1] = 1.0 / h;
	row += ((-3.0 * right * right / h + h) / 6.0) * second_derivative_map_.row(j);
	row += ((3.0 * left * left / h - h) / 6.0) * second_derivative_map_.row(j + 1);
	return row;
}

Eigen::RowVectorXd CubicRegressionSpline::basisRow(double x) const {
	const Eigen::Index last = knots_.size() - 1;
	if (x < knots_[0]) {
		Eigen::RowVectorXd row = (x - knots_[0]) * derivativeRow(knots_[0], 0);
		row[0] += 1.0;
		return row;
	}
	if (x > knots_[last]) {
		Eigen::RowVectorXd row = (x - knots_[last]) * derivativeRow(knots_[last], last - 1);
		row[last] += 1.0;
		return row;
	}

	const Eigen::Index j = intervalOf(x);
	const double h = knots_[j + 1] - knots_[j];
	const double right = knots_[j + 1] - x;
	const double left = x - knots_[j];

	Eigen::RowVectorXd row = Eigen::RowVectorXd::Zero(knots_.size());
	row[j] = right / h;
	row[j + 1] = left / h;
	row += ((right * right * right / h - h * right) / 6.0) * second_derivative_map_.row(j);
	row += ((left * left * left / h - h * left) / 6.0) * second_derivative_map_.row(j + 1);
	return row;
}

Eigen::RowVectorXd CubicRegressionSpline::constrainedRow(double x) const {
	return basisRow(x) * null_space_;
}

Eigen::MatrixXd CubicRegressionSpline::constrainedBasis(const std::vector<double> &x) const {
	Eigen::MatrixXd basis(static_cast<Eigen::Index>(x.size()), null_space_.cols());
	for (std::size_t i = 0; i < x.size(); ++i) {
		basis.row(static_cast<Eigen::Index>(i)) = constrainedRow(x[i]);
	}
	return basis;
}

} // namespace phenoindex::stats
