#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/core/season_table.hpp"
#include "pheno-index/pheno/diagnostics.hpp"
#include "pheno-index/stats/gam.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace phenoindex::pheno {

struct CurveFitterOptions {
	/// Sites beyond this many are subsampled without replacement at every trial.
	std::size_t max_sites = 100;
	stats::Family family = stats::Family::Poisson;
	int max_trials = 3;
	bool fast_mode = true;
	/// Fall back to the standard fit when the sample has no more than `fast_mode_threshold` sites.
	bool auto_fast_mode = true;
	std::size_t fast_mode_threshold = 100;
	stats::GamControl control;
};

/**
 * @brief A season row of one species-year with its day number re-based to 1.
 */
struct TrimmedCount {
	core::SeasonCount season;
	int trim_day_no = 0;
};

/**
 * @brief One (site, day) row of the data a flight curve was estimated from.
 */
struct CurveWorkingRow {
	core::SeasonCount season;
	int trim_day_no = 0;
	std::optional<double> fitted;
	std::optional<double> site_sum;
	std::optional<double> nm;
};

struct CurveFit {
	/// One point per day, ordered by day_since.
	std::vector<core::FlightCurvePoint> curve;
	stats::GamFitResult model = stats::FitFailure {"No fit attempted."};
	std::vector<CurveWorkingRow> data;
	int trials = 0;
	std::vector<Diagnostic> diagnostics;
};

/**
 * @class CurveFitter
 * @brief Estimates the flight curve of one species-year from pooled site counts.
 *
 * The regional model is count ~ s(trim_day_no) + site, the site term being
 * dropped when a single site remains. A failed fit is retried up to
 * `max_trials` times, each trial drawing a fresh site sample. The fitted
 * values (zero outside the season) are normalised to sum to one per site.
 * Failure and non-finite predictions leave the whole curve without NM.
 */
class CurveFitter {
public:
	explicit CurveFitter(std::shared_ptr<stats::ICurveSolver> solver, CurveFitterOptions options = {});

	/**
	 * @brief Fits the curve of the species-year held in `rows`.
	 * @param rows Season rows of a single species and year.
	 * @param rng Random source of the site subsampling.
	 */
	CurveFit fit(const std::vector<TrimmedCount> &rows, std::mt19937_64 &rng) const;

	/// Whether a sample of `site_count` sites is fitted in fast mode.
	bool useFastMode(std::size_t site_count) const;

	const CurveFitterOptions &options() const {
		return options_;
	}

private:
	std::vector<TrimmedCount> sampleSites(const std::vector<TrimmedCount> &rows, std::mt19937_64 &rng) const;

	std::shared_ptr<stats::ICurveSolver> solver_;
	CurveFitterOptions options_;
};

/// Distinct site ids in order of first appearance.
std::vector<std::string> distinctSites(const std::vector<TrimmedCount> &rows);

/// Collapses working rows to one curve point per day_since, ordered by day.
std::vector<core::FlightCurvePoint> curveFromWorkingData(const std::vector<CurveWorkingRow> &data);

} // namespace phenoindex::pheno
