#include "pheno-index/pheno/curve_estimator.hpp"

#include "pheno-index/core/errors.hpp"
#include "pheno-index/utils/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace phenoindex::pheno {

void CurveEstimatorConfig::validate() const {
	if (max_sites_per_fit < 1) {
		throw core::InputContractError("max_sites_per_fit must be at least 1.");
	}
	if (min_visits < 0 || min_occurrences < 0 || min_sites < 0) {
		throw core::InputContractError("Visit, occurrence and site thresholds must not be negative.");
	}
	if (max_retries < 1) {
		throw core::InputContractError("max_retries must be at least 1.");
	}
	if (solver_max_iterations < 1) {
		throw core::InputContractError("solver_max_iterations must be at least 1.");
	}
	if (spline_knots < 3) {
		throw core::InputContractError("spline_knots must be at least 3.");
	}
}

std::vector<TrimmedCount> trimYear(const core::SeasonTable &table, int year) {
	std::vector<TrimmedCount> rows;
	std::int64_t first_day = 0;
	for (const auto &row : table.rows()) {
		if (row.m_year != year) {
			continue;
		}
		if (rows.empty() || row.day_since < first_day) {
			first_day = row.day_since;
		}
		rows.push_back(TrimmedCount {row, 0});
	}
	for (auto &row : rows) {
		row.trim_day_no = static_cast<int>(row.season.day_since - first_day + 1);
	}
	return rows;
}

std::vector<std::string> qualifyingSites(const std::vector<TrimmedCount> &rows, int min_visits, int min_occurrences) {
	std::unordered_map<std::string, std::pair<int, int>> tallies;
	for (const auto &row : rows) {
		auto &tally = tallies[row.season.site_id];
		if (!row.season.count || row.season.anchor) {
			continue;
		}
		++tally.first;
		if (*row.season.count > 0.0) {
			++tally.second;
		}
	}

	std::vector<std::string> sites;
	for (const auto &site : distinctSites(rows)) {
		const auto &tally = tallies.at(site);
		if (tally.first >= min_visits && tally.second >= min_occurrences) {
			sites.push_back(site);
		}
	}
	return sites;
}

CurveEstimator::CurveEstimator(CurveEstimatorConfig config, std::shared_ptr<stats::ICurveSolver> solver)
    : config_(std::move(config)), solver_(std::move(solver)) {
	config_.validate();
	if (!solver_) {
		throw std::invalid_argument("CurveEstimator requires a curve solver.");
	}
}

CurveFitterOptions CurveEstimator::fitterOptions() const {
	CurveFitterOptions options;
	options.max_sites = config_.max_sites_per_fit;
	options.family = config_.model_family;
	options.max_trials = config_.max_retries;
	options.fast_mode = config_.fast_mode;
	options.auto_fast_mode = config_.auto_fast_mode_threshold;
	options.control.max_iterations = config_.solver_max_iterations;
	options.control.basis_dimension = config_.spline_knots;
	return options;
}

std::vector<int> CurveEstimator::selectYears(const core::SeasonTable &table) const {
	auto years = table.years();
	if (config_.years) {
		const auto &wanted = *config_.years;
		years.erase(std::remove_if(years.begin(), years.end(),
		                           [&wanted](int year) {
			                           return std::find(wanted.begin(), wanted.end(), year) == wanted.end();
		                           }),
		            years.end());
	}
	return years;
}

CurveEstimate CurveEstimator::estimate(const core::SeasonTable &input) const {
	CurveEstimate result;
	if (input.speciesList().size() > 1) {
		throw core::InputContractError("Flight curves are estimated one species at a time.");
	}

	const core::SeasonTable table = config_.restrict_to_complete_seasons ? input.completeSeasonsOnly() : input;
	if (table.empty()) {
		PHENO_WARN("No season rows left to estimate flight curves from.");
		return result;
	}

	const std::string species = table.species();
	const CurveFitter fitter(solver_, fitterOptions());
	std::mt19937_64 rng(config_.seed);

	for (int year : selectYears(table)) {
		const auto year_rows = trimYear(table, year);
		const auto sites = qualifyingSites(year_rows, config_.min_visits, config_.min_occurrences);
		const core::ModelKey key {species, year};

		if (sites.empty() || sites.size() < static_cast<std::size_t>(config_.min_sites)) {
			report(result.diagnostics, DiagnosticKind::InsufficientSites, species, year,
			       "not enough sites with observations to estimate the flight curve (" +
			           std::to_string(sites.size()) + " qualifying)");

			std::vector<CurveWorkingRow> empty_curve;
			empty_curve.reserve(year_rows.size());
			for (const auto &row : year_rows) {
				empty_curve.push_back(CurveWorkingRow {row.season, row.trim_day_no, {}, {}, {}});
			}
			result.curves.append(curveFromWorkingData(empty_curve));
			if (config_.retain_models) {
				result.models.insert_or_assign(key, stats::GamFitResult {stats::FitFailure {"Not enough sites."}});
			}
			continue;
		}

		const std::unordered_set<std::string> keep(sites.begin(), sites.end());
		std::vector<TrimmedCount> pooled;
		std::copy_if(year_rows.begin(), year_rows.end(), std::back_inserter(pooled),
		             [&keep](const TrimmedCount &row) { return keep.count(row.season.site_id) > 0; });

		auto fit = fitter.fit(pooled, rng);
		result.curves.append(fit.curve);
		result.diagnostics.insert(result.diagnostics.end(), fit.diagnostics.begin(), fit.diagnostics.end());
		if (config_.retain_models) {
			result.models.insert_or_assign(key, std::move(fit.model));
		}
		if (config_.retain_working_data) {
			result.data.insert(result.data.end(), std::make_move_iterator(fit.data.begin()),
			                   std::make_move_iterator(fit.data.end()));
		}
	}
	return result;
}

CurveEstimate estimateCurves(const core::SeasonTable &table, const CurveEstimatorConfig &config) {
	return CurveEstimator(config).estimate(table);
}

} // namespace phenoindex::pheno
