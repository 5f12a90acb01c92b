#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "pheno-index/optimization/lbfgs_optimizer.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using phenoindex::optimization::LBFGSOptimizer;

TEST_CASE("LBFGSOptimizer minimizes a quadratic with analytic gradient", "[optimization][lbfgs]") {
	auto objective = [](const std::vector<double> &x, std::vector<double> &grad) {
		grad.resize(2);
		grad[0] = 2.0 * (x[0] - 2.0);
		grad[1] = 4.0 * (x[1] + 1.0);
		return (x[0] - 2.0) * (x[0] - 2.0) + 2.0 * (x[1] + 1.0) * (x[1] + 1.0);
	};

	const auto result = LBFGSOptimizer::minimize(objective, {0.0, 0.0}, {-10.0, -10.0}, {10.0, 10.0});
	REQUIRE(result.x[0] == Catch::Approx(2.0).margin(1e-4));
	REQUIRE(result.x[1] == Catch::Approx(-1.0).margin(1e-4));
	REQUIRE(result.fx == Catch::Approx(0.0).margin(1e-8));
	REQUIRE(result.evaluations > 0);
}

TEST_CASE("LBFGSOptimizer stops at an active bound", "[optimization][lbfgs]") {
	auto objective = [](const std::vector<double> &x) { return (x[0] - 10.0) * (x[0] - 10.0); };

	const auto result = LBFGSOptimizer::minimizeNumeric(objective, {0.0}, {0.0}, {5.0});
	REQUIRE(result.x[0] == Catch::Approx(5.0).margin(1e-6));
	REQUIRE(result.fx == Catch::Approx(25.0).margin(1e-4));
}

TEST_CASE("LBFGSOptimizer never returns a point worse than the start", "[optimization][lbfgs]") {
	auto objective = [](const std::vector<double> &x) {
		return x[0] > 1.0 ? std::numeric_limits<double>::quiet_NaN() : (x[0] - 3.0) * (x[0] - 3.0);
	};

	const auto result = LBFGSOptimizer::minimizeNumeric(objective, {0.0}, {-5.0}, {5.0});
	REQUIRE(std::isfinite(result.fx));
	REQUIRE(result.fx <= 9.0);
	REQUIRE(result.x[0] <= 1.0);
}

TEST_CASE("LBFGSOptimizer validates bounds", "[optimization][lbfgs]") {
	auto objective = [](const std::vector<double> &x) { return x[0] * x[0]; };
	REQUIRE_THROWS_AS(LBFGSOptimizer::minimizeNumeric(objective, {0.0}, {1.0}, {-1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(LBFGSOptimizer::minimizeNumeric(objective, {0.0, 1.0}, {-1.0}, {1.0}), std::invalid_argument);
}
