#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/season_fixtures.hpp"
#include "common/solver_doubles.hpp"
#include "pheno-index/pheno/site_regression_fitter.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using phenoindex::core::ImputedCount;
using phenoindex::pheno::DiagnosticKind;
using phenoindex::pheno::SiteRegressionFitter;
using phenoindex::pheno::SiteRegressionOptions;
using phenoindex::stats::Family;

namespace {

/// Season rows of one year joined with a complete bell-shaped curve.
std::vector<ImputedCount> joinedRows(const tests::helpers::SeasonSpec &spec) {
	const int year = spec.years.front();
	const auto curve = tests::helpers::makeCurve(spec, year);
	std::vector<ImputedCount> rows;
	for (const auto &row : tests::helpers::makeSeasonRows(spec)) {
		ImputedCount joined;
		joined.season = row;
		const auto &point = curve[static_cast<std::size_t>(row.day_since)];
		joined.trim_day_no = point.trim_day_no;
		joined.nm = point.m_season == 0 ? point.nm : std::max(*point.nm, 1e-6);
		if (row.m_season == 0) {
			joined.season.count.reset();
		}
		rows.push_back(joined);
	}
	return rows;
}

} // namespace

TEST_CASE("SiteRegressionFitter fits nonzero sites and zeroes the rest", "[pheno][site_regression]") {
	tests::helpers::SeasonSpec spec;
	spec.zero_sites = {"S2", "S3"};
	auto rows = joinedRows(spec);

	auto solver = std::make_shared<tests::helpers::RecordingGlmSolver>();
	std::vector<phenoindex::pheno::Diagnostic> diagnostics;
	const auto result = SiteRegressionFitter(solver).fit(rows, diagnostics);

	REQUIRE(result.attempted);
	REQUIRE(result.nonzero_sites == std::vector<std::string> {"S1"});
	REQUIRE(result.zero_sites == std::vector<std::string> {"S2", "S3"});
	REQUIRE(phenoindex::stats::succeeded(result.model));

	REQUIRE(solver->problems.size() == 1);
	const auto &problem = solver->problems.front();
	REQUIRE(problem.response.size() == spec.season_length);
	REQUIRE(problem.design.cols() == 1);
	REQUIRE(problem.family == Family::QuasiPoisson);
	REQUIRE(problem.control.max_iterations == 100);

	for (const auto &row : rows) {
		REQUIRE(row.fitted.has_value());
		if (row.season.site_id != "S1") {
			REQUIRE(*row.fitted == 0.0);
		} else if (row.season.m_season != 0) {
			REQUIRE(*row.fitted > 0.0);
		}
	}
	REQUIRE(diagnostics.empty());
}

TEST_CASE("SiteRegressionFitter scales the curve to each site", "[pheno][site_regression]") {
	tests::helpers::SeasonSpec spec;
	spec.site_scale = {1.0, 0.5, 2.0};
	auto rows = joinedRows(spec);

	auto solver = std::make_shared<tests::helpers::RecordingGlmSolver>();
	std::vector<phenoindex::pheno::Diagnostic> diagnostics;
	const auto result = SiteRegressionFitter(solver).fit(rows, diagnostics);

	REQUIRE(result.nonzero_sites.size() == 3);
	REQUIRE(solver->problems.front().design.cols() == 3);

	double total[3] = {0.0, 0.0, 0.0};
	for (const auto &row : rows) {
		const std::size_t site = row.season.site_id == "S1" ? 0 : row.season.site_id == "S2" ? 1 : 2;
		total[site] += row.fitted.value();
	}
	REQUIRE(total[2] / total[0] == Catch::Approx(2.0).epsilon(0.25));
	REQUIRE(total[1] / total[0] == Catch::Approx(0.5).epsilon(0.25));
}

TEST_CASE("SiteRegressionFitter uses the raw curve as negative binomial offset", "[pheno][site_regression]") {
	tests::helpers::SeasonSpec spec;
	spec.zero_sites = {"S2", "S3"};
	auto rows = joinedRows(spec);

	auto solver = std::make_shared<tests::helpers::RecordingGlmSolver>(true);
	SiteRegressionOptions options;
	options.family = Family::NegativeBinomial;
	std::vector<phenoindex::pheno::Diagnostic> diagnostics;
	SiteRegressionFitter(solver, options).fit(rows, diagnostics);

	const auto &problem = solver->problems.front();
	REQUIRE(problem.design.cols() == 0);
	const auto &first = rows.front();
	REQUIRE(problem.offset[0] == Catch::Approx(*first.nm));
}

TEST_CASE("SiteRegressionFitter marks a failed fit as missing", "[pheno][site_regression]") {
	tests::helpers::SeasonSpec spec;
	spec.zero_sites = {"S3"};
	auto rows = joinedRows(spec);
	for (auto &row : rows) {
		row.count_imputed = 1.0;
	}

	auto solver = std::make_shared<tests::helpers::RecordingGlmSolver>(true);
	std::vector<phenoindex::pheno::Diagnostic> diagnostics;
	const auto result = SiteRegressionFitter(solver).fit(rows, diagnostics);

	REQUIRE_FALSE(phenoindex::stats::succeeded(result.model));
	REQUIRE(phenoindex::pheno::countOf(diagnostics, DiagnosticKind::FitFailure) == 1);
	for (const auto &row : rows) {
		if (row.season.site_id == "S3") {
			REQUIRE(row.fitted == 0.0);
		} else {
			REQUIRE_FALSE(row.fitted.has_value());
			REQUIRE_FALSE(row.count_imputed.has_value());
		}
	}
}

TEST_CASE("SiteRegressionFitter requires a complete curve except on the leap day", "[pheno][site_regression]") {
	tests::helpers::SeasonSpec spec;
	spec.season_length = 366;
	spec.season_start = 150;
	spec.season_end = 200;
	spec.peak_day = 175.0;
	std::vector<phenoindex::pheno::Diagnostic> diagnostics;
	auto solver = std::make_shared<tests::helpers::RecordingGlmSolver>();

	SECTION("missing NM on day 366 is tolerated") {
		auto rows = joinedRows(spec);
		for (auto &row : rows) {
			if (row.trim_day_no == 366) {
				row.nm.reset();
			}
		}
		const auto result = SiteRegressionFitter(solver).fit(rows, diagnostics);
		REQUIRE(result.attempted);
		REQUIRE(solver->problems.size() == 1);
		REQUIRE(diagnostics.empty());
	}
	SECTION("missing NM elsewhere skips the regression") {
		auto rows = joinedRows(spec);
		rows[200].nm.reset();
		const auto result = SiteRegressionFitter(solver).fit(rows, diagnostics);
		REQUIRE_FALSE(result.attempted);
		REQUIRE(solver->problems.empty());
		REQUIRE(phenoindex::pheno::countOf(diagnostics, DiagnosticKind::RegressionSkipped) == 1);
		REQUIRE_FALSE(rows[210].fitted.has_value());
	}
}
