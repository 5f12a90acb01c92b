#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "pheno-index/core/errors.hpp"
#include "pheno-index/stats/family.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <random>

using phenoindex::stats::Family;
namespace family = phenoindex::stats::family;

TEST_CASE("parseFamily accepts the supported names in any case", "[stats][family]") {
	REQUIRE(phenoindex::stats::parseFamily("poisson") == Family::Poisson);
	REQUIRE(phenoindex::stats::parseFamily("QuasiPoisson") == Family::QuasiPoisson);
	REQUIRE(phenoindex::stats::parseFamily("nb") == Family::NegativeBinomial);
	REQUIRE(phenoindex::stats::parseFamily("NEGBIN") == Family::NegativeBinomial);
	REQUIRE_THROWS_AS(phenoindex::stats::parseFamily("gaussian"), phenoindex::core::InputContractError);

	REQUIRE(phenoindex::stats::familyName(Family::QuasiPoisson) == "quasipoisson");
	REQUIRE(phenoindex::stats::hasKnownScale(Family::Poisson));
	REQUIRE_FALSE(phenoindex::stats::hasKnownScale(Family::QuasiPoisson));
}

TEST_CASE("Variance functions follow the family", "[stats][family]") {
	REQUIRE(family::variance(Family::Poisson, 4.0, 0.0) == Catch::Approx(4.0));
	REQUIRE(family::variance(Family::QuasiPoisson, 4.0, 0.0) == Catch::Approx(4.0));
	REQUIRE(family::variance(Family::NegativeBinomial, 4.0, 2.0) == Catch::Approx(12.0));
	REQUIRE(family::workingWeight(Family::NegativeBinomial, 4.0, 2.0) == Catch::Approx(16.0 / 12.0));
}

TEST_CASE("Deviance vanishes at a perfect fit and grows away from it", "[stats][family]") {
	Eigen::VectorXd y(4);
	y << 0.0, 1.0, 5.0, 12.0;
	Eigen::VectorXd exact = y.array().max(1e-12).matrix();
	Eigen::VectorXd off = (y.array() + 1.0).matrix();

	REQUIRE(family::deviance(Family::Poisson, y, exact, 0.0) == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(family::deviance(Family::Poisson, y, off, 0.0) > 0.0);
	REQUIRE(family::deviance(Family::NegativeBinomial, y, off, 5.0) <
	        family::deviance(Family::Poisson, y, off, 0.0));
}

TEST_CASE("Pearson dispersion is chi-square over residual degrees of freedom", "[stats][family]") {
	Eigen::VectorXd y(3);
	y << 2.0, 4.0, 6.0;
	Eigen::VectorXd mu = Eigen::VectorXd::Constant(3, 4.0);
	// (4 + 0 + 4) / 4 over 3 - 1 degrees of freedom
	REQUIRE(family::pearsonDispersion(Family::QuasiPoisson, y, mu, 0.0, 1) == Catch::Approx(1.0));
	REQUIRE(std::isnan(family::pearsonDispersion(Family::QuasiPoisson, y, mu, 0.0, 3)));
}

TEST_CASE("estimateTheta separates overdispersed from Poisson-like counts", "[stats][family]") {
	std::mt19937_64 rng(11);
	const int n = 400;
	const double mean = 10.0;

	Eigen::VectorXd overdispersed(n);
	std::gamma_distribution<double> gamma(2.0, mean / 2.0);
	for (int i = 0; i < n; ++i) {
		std::poisson_distribution<int> draw(gamma(rng));
		overdispersed[i] = draw(rng);
	}
	Eigen::VectorXd poisson_like(n);
	std::poisson_distribution<int> plain(mean);
	for (int i = 0; i < n; ++i) {
		poisson_like[i] = plain(rng);
	}
	const Eigen::VectorXd mu = Eigen::VectorXd::Constant(n, mean);

	const double theta_small = family::estimateTheta(overdispersed, mu);
	const double theta_large = family::estimateTheta(poisson_like, mu);

	REQUIRE(std::isfinite(theta_small));
	REQUIRE(theta_small > 0.8);
	REQUIRE(theta_small < 5.0);
	REQUIRE(theta_large > 20.0);
}
