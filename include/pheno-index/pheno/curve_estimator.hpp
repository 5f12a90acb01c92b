#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/core/model_key.hpp"
#include "pheno-index/core/season_table.hpp"
#include "pheno-index/pheno/curve_fitter.hpp"
#include "pheno-index/pheno/diagnostics.hpp"
#include "pheno-index/stats/gam.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace phenoindex::pheno {

/**
 * @brief Settings of the per-year flight curve estimation.
 */
struct CurveEstimatorConfig {
	std::size_t max_sites_per_fit = 100;
	/// Minimum non-anchor visits of a site within the year.
	int min_visits = 3;
	/// Minimum non-anchor visits with a positive count.
	int min_occurrences = 2;
	/// Minimum qualifying sites needed to fit a year.
	int min_sites = 1;
	int max_retries = 3;
	stats::Family model_family = stats::Family::Poisson;
	bool restrict_to_complete_seasons = true;
	/// Years to estimate; every year of the table when empty.
	std::optional<std::vector<int>> years;
	bool fast_mode = true;
	/// Only use fast mode for samples of more than 100 sites.
	bool auto_fast_mode_threshold = true;
	bool retain_models = true;
	bool retain_working_data = true;
	std::uint64_t seed = 42;
	int solver_max_iterations = 200;
	int spline_knots = 10;

	/// @throws core::InputContractError on out-of-range values.
	void validate() const;
};

struct CurveEstimate {
	core::FlightCurveTable curves;
	/// Curve models keyed by (species, year); empty unless models are retained.
	std::map<core::ModelKey, stats::GamFitResult> models;
	/// Data the curves were fitted on; empty unless working data is retained.
	std::vector<CurveWorkingRow> data;
	std::vector<Diagnostic> diagnostics;
};

/**
 * @class CurveEstimator
 * @brief Estimates the flight curve of every requested year of one species.
 *
 * Within a year only sites meeting the visit and occurrence thresholds are
 * pooled. A year with fewer than `min_sites` such sites gets a curve without
 * NM and no fit is attempted.
 */
class CurveEstimator {
public:
	explicit CurveEstimator(CurveEstimatorConfig config = {},
	                        std::shared_ptr<stats::ICurveSolver> solver = std::make_shared<stats::GamSolver>());

	/**
	 * @brief Estimates the curves of a single-species season table.
	 * @throws core::InputContractError if the table holds more than one species.
	 */
	CurveEstimate estimate(const core::SeasonTable &table) const;

	const CurveEstimatorConfig &config() const {
		return config_;
	}

private:
	CurveFitterOptions fitterOptions() const;
	std::vector<int> selectYears(const core::SeasonTable &table) const;

	CurveEstimatorConfig config_;
	std::shared_ptr<stats::ICurveSolver> solver_;
};

/// Rows of one year with trim_day_no = day_since - min(day_since) + 1.
std::vector<TrimmedCount> trimYear(const core::SeasonTable &table, int year);

/// Sites of `rows` meeting the visit and occurrence thresholds, in order of first appearance.
std::vector<std::string> qualifyingSites(const std::vector<TrimmedCount> &rows, int min_visits, int min_occurrences);

CurveEstimate estimateCurves(const core::SeasonTable &table, const CurveEstimatorConfig &config = {});

} // namespace phenoindex::pheno
