#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/pheno/diagnostics.hpp"
#include "pheno-index/stats/glm.hpp"

#include <memory>
#include <string>
#include <vector>

namespace phenoindex::pheno {

struct SiteRegressionOptions {
	stats::Family family = stats::Family::QuasiPoisson;
	int max_iterations = 100;
};

struct SiteRegressionResult {
	stats::GlmFitResult model = stats::FitFailure {"No regression fitted."};
	std::vector<std::string> nonzero_sites;
	std::vector<std::string> zero_sites;
	/// False when the regression was skipped for missing phenology or lack of counts.
	bool attempted = false;
};

/**
 * @class SiteRegressionFitter
 * @brief Fits one year's site counts against the flight curve offset.
 *
 * Only sites with a positive observed total enter the regression, with one
 * effect per site. Quasi-Poisson uses log(NM) as offset; the negative
 * binomial uses NM itself. Sites whose observed counts are all zero (or
 * missing) get a fitted value of exactly zero without a fit.
 */
class SiteRegressionFitter {
public:
	explicit SiteRegressionFitter(std::shared_ptr<stats::IGlmSolver> solver, SiteRegressionOptions options = {});

	/**
	 * @brief Fills `fitted` on the rows of one species-year.
	 *
	 * A year whose NM is missing on any day other than trimmed day 366 is not
	 * fitted. A failed fit leaves `fitted` and `count_imputed` of the
	 * regression sites empty.
	 */
	SiteRegressionResult fit(std::vector<core::ImputedCount> &year_rows, std::vector<Diagnostic> &diagnostics) const;

	const SiteRegressionOptions &options() const {
		return options_;
	}

private:
	std::shared_ptr<stats::IGlmSolver> solver_;
	SiteRegressionOptions options_;
};

/// Trimmed day exempt from the complete-phenology requirement.
constexpr int kLeapTrimDay = 366;

/// True if NM is missing on a row other than the leap day.
bool phenologyBlocksRegression(const std::vector<core::ImputedCount> &year_rows);

} // namespace phenoindex::pheno
