#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/core/season_table.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace tests::helpers {

using phenoindex::core::FlightCurvePoint;
using phenoindex::core::ImputedCount;
using phenoindex::core::SeasonCount;
using phenoindex::core::TimePoint;

/// Calendar day `day` days after the series origin.
inline TimePoint dayPoint(std::int64_t day) {
	return TimePoint {} + std::chrono::hours(24 * day);
}

/**
 * @brief Shape of a synthetic monitoring scheme.
 *
 * Each year spans `season_length` days starting at day_since (year - first) * 365.
 * Days `season_start`..`season_end` (1-based within the year) are in season.
 * Sites are visited every `visit_every` in-season days, and a zero anchor row
 * sits just outside each end of the season.
 */
struct SeasonSpec {
	std::string species = "Pieris napi";
	std::vector<std::string> sites {"S1", "S2", "S3"};
	/// Multiplier of the expected count per site (defaults to 1).
	std::vector<double> site_scale {1.0, 0.6, 1.5};
	std::vector<std::string> zero_sites;
	std::vector<int> years {2012};
	int season_length = 60;
	int season_start = 6;
	int season_end = 55;
	int visit_every = 3;
	double peak = 25.0;
	double peak_day = 30.0;
	double spread = 8.0;
	bool complete = true;
	std::uint64_t seed = 7;
};

inline double expectedCount(const SeasonSpec &spec, std::size_t site, int trim_day) {
	const double scale = site < spec.site_scale.size() ? spec.site_scale[site] : 1.0;
	const double z = (static_cast<double>(trim_day) - spec.peak_day) / spec.spread;
	return spec.peak * scale * std::exp(-0.5 * z * z);
}

/// Season rows with Poisson counts drawn from a fixed-seed engine.
inline std::vector<SeasonCount> makeSeasonRows(const SeasonSpec &spec) {
	std::mt19937_64 rng(spec.seed);
	std::vector<SeasonCount> rows;
	const int first_year = spec.years.empty() ? 0 : spec.years.front();

	for (int year : spec.years) {
		const std::int64_t origin = static_cast<std::int64_t>(year - first_year) * 365;
		for (std::size_t s = 0; s < spec.sites.size(); ++s) {
			const auto &site = spec.sites[s];
			const bool zero_site = std::find(spec.zero_sites.begin(), spec.zero_sites.end(), site) != spec.zero_sites.end();
			for (int trim = 1; trim <= spec.season_length; ++trim) {
				SeasonCount row;
				row.species = spec.species;
				row.site_id = site;
				row.day_since = origin + trim - 1;
				row.date = dayPoint(row.day_since);
				row.week = (trim - 1) / 7 + 1;
				row.week_day = (trim - 1) % 7 + 1;
				row.m_year = year;
				row.m_season = trim >= spec.season_start && trim <= spec.season_end ? 1 : 0;
				row.complete_season = spec.complete;

				if (trim == spec.season_start - 1 || trim == spec.season_end + 1) {
					row.anchor = true;
					row.count = 0.0;
				} else if (row.m_season != 0 && (trim - spec.season_start) % spec.visit_every == 0) {
					std::poisson_distribution<int> draw(expectedCount(spec, s, trim));
					const int value = draw(rng);
					row.count = zero_site ? 0.0 : static_cast<double>(value);
				}
				rows.push_back(row);
			}
		}
	}
	return rows;
}

inline phenoindex::core::SeasonTable makeSeasonTable(const SeasonSpec &spec) {
	return phenoindex::core::SeasonTable(makeSeasonRows(spec));
}

/**
 * @brief Complete curve for one year: a bell over the season, zero outside, summing to one.
 */
inline std::vector<FlightCurvePoint> makeCurve(const SeasonSpec &spec, int year, bool missing = false) {
	const int first_year = spec.years.empty() ? year : spec.years.front();
	const std::int64_t origin = static_cast<std::int64_t>(year - first_year) * 365;

	std::vector<double> weights;
	double total = 0.0;
	for (int trim = 1; trim <= spec.season_length; ++trim) {
		const bool in_season = trim >= spec.season_start && trim <= spec.season_end;
		const double weight = in_season ? expectedCount(spec, 0, trim) : 0.0;
		weights.push_back(weight);
		total += weight;
	}

	std::vector<FlightCurvePoint> curve;
	for (int trim = 1; trim <= spec.season_length; ++trim) {
		FlightCurvePoint point;
		point.species = spec.species;
		point.day_since = origin + trim - 1;
		point.date = dayPoint(point.day_since);
		point.week = (trim - 1) / 7 + 1;
		point.week_day = (trim - 1) % 7 + 1;
		point.m_year = year;
		point.m_season = trim >= spec.season_start && trim <= spec.season_end ? 1 : 0;
		point.trim_day_no = trim;
		if (!missing) {
			point.nm = weights[static_cast<std::size_t>(trim - 1)] / total;
		}
		curve.push_back(point);
	}
	return curve;
}

inline ImputedCount makeImputedRow(const std::string &site, int year, int week, int week_day,
                                   std::optional<double> fitted, int m_season = 1, bool complete = true) {
	ImputedCount row;
	row.season.species = "Pieris napi";
	row.season.site_id = site;
	row.season.m_year = year;
	row.season.week = week;
	row.season.week_day = week_day;
	row.season.day_since = static_cast<std::int64_t>(week) * 7 + week_day;
	row.season.date = dayPoint(row.season.day_since);
	row.season.m_season = m_season;
	row.season.complete_season = complete;
	row.fitted = fitted;
	row.count_imputed = fitted;
	return row;
}

} // namespace tests::helpers
