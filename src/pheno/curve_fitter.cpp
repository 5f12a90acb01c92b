#include "pheno-index/pheno/curve_fitter.hpp"

#include "pheno-index/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace phenoindex::pheno {

namespace {

double roundTo5(double value) {
	return std::round(value * 1e5) / 1e5;
}

void clearFit(std::vector<CurveWorkingRow> &data) {
	for (auto &row : data) {
		row.fitted.reset();
		row.site_sum.reset();
		row.nm.reset();
	}
}

} // namespace

std::vector<std::string> distinctSites(const std::vector<TrimmedCount> &rows) {
	std::vector<std::string> sites;
	std::unordered_set<std::string> seen;
	for (const auto &row : rows) {
		if (seen.insert(row.season.site_id).second) {
			sites.push_back(row.season.site_id);
		}
	}
	return sites;
}

std::vector<core::FlightCurvePoint> curveFromWorkingData(const std::vector<CurveWorkingRow> &data) {
	std::map<std::int64_t, core::FlightCurvePoint> by_day;
	for (const auto &row : data) {
		if (by_day.count(row.season.day_since) > 0) {
			continue;
		}
		core::FlightCurvePoint point;
		point.species = row.season.species;
		point.date = row.season.date;
		point.week = row.season.week;
		point.week_day = row.season.week_day;
		point.day_since = row.season.day_since;
		point.m_year = row.season.m_year;
		point.m_season = row.season.m_season;
		point.trim_day_no = row.trim_day_no;
		point.nm = row.nm;
		by_day.emplace(row.season.day_since, std::move(point));
	}

	std::vector<core::FlightCurvePoint> curve;
	curve.reserve(by_day.size());
	for (auto &entry : by_day) {
		curve.push_back(std::move(entry.second));
	}
	return curve;
}

CurveFitter::CurveFitter(std::shared_ptr<stats::ICurveSolver> solver, CurveFitterOptions options)
    : solver_(std::move(solver)), options_(std::move(options)) {
	if (!solver_) {
		throw std::invalid_argument("CurveFitter requires a curve solver.");
	}
	if (options_.max_sites < 1) {
		throw std::invalid_argument("CurveFitter: max_sites must be at least 1.");
	}
	if (options_.max_trials < 1) {
		throw std::invalid_argument("CurveFitter: max_trials must be at least 1.");
	}
}

bool CurveFitter::useFastMode(std::size_t site_count) const {
	if (!options_.fast_mode) {
		return false;
	}
	return !options_.auto_fast_mode || site_count > options_.fast_mode_threshold;
}

std::vector<TrimmedCount> CurveFitter::sampleSites(const std::vector<TrimmedCount> &rows,
                                                   std::mt19937_64 &rng) const {
	const auto sites = distinctSites(rows);
	if (sites.size() <= options_.max_sites) {
		return rows;
	}

	std::vector<std::string> chosen;
	chosen.reserve(options_.max_sites);
	std::sample(sites.begin(), sites.end(), std::back_inserter(chosen), options_.max_sites, rng);
	const std::unordered_set<std::string> keep(chosen.begin(), chosen.end());

	std::vector<TrimmedCount> sampled;
	std::copy_if(rows.begin(), rows.end(), std::back_inserter(sampled),
	             [&keep](const TrimmedCount &row) { return keep.count(row.season.site_id) > 0; });
	return sampled;
}

CurveFit CurveFitter::fit(const std::vector<TrimmedCount> &rows, std::mt19937_64 &rng) const {
	if (rows.empty()) {
		throw std::invalid_argument("CurveFitter: no rows to fit.");
	}

	const std::string species = rows.front().season.species;
	const int year = rows.front().season.m_year;

	CurveFit result;
	std::vector<TrimmedCount> sample;
	std::unordered_map<std::string, std::size_t> levels;

	while (result.trials < options_.max_trials) {
		++result.trials;
		sample = sampleSites(rows, rng);

		levels.clear();
		for (const auto &site : distinctSites(sample)) {
			levels.emplace(site, levels.size());
		}

		stats::GamProblem problem;
		problem.family = options_.family;
		problem.control = options_.control;
		problem.control.fast = useFastMode(levels.size());
		problem.group_count = levels.size();
		problem.covariate.reserve(sample.size());
		problem.response.reserve(sample.size());
		problem.group.reserve(sample.size());
		for (const auto &row : sample) {
			problem.covariate.push_back(static_cast<double>(row.trim_day_no));
			problem.response.push_back(row.season.count ? *row.season.count : std::nan(""));
			problem.group.push_back(levels.at(row.season.site_id));
		}

		PHENO_INFO("Fitting the regional GAM for species {} and year {} with {} sites, using {} -> trial {}",
		           species, year, levels.size(), problem.control.fast ? "fast mode" : "standard mode",
		           result.trials);

		try {
			result.model = solver_->fit(problem);
		} catch (const std::exception &e) {
			result.model = stats::FitFailure {e.what()};
		}
		if (stats::succeeded(result.model)) {
			break;
		}
		PHENO_DEBUG("Trial {} for species {} and year {} failed: {}", result.trials, species, year,
		            std::get<stats::FitFailure>(result.model).reason);
	}

	result.data.reserve(sample.size());
	for (const auto &row : sample) {
		CurveWorkingRow working;
		working.season = row.season;
		working.trim_day_no = row.trim_day_no;
		result.data.push_back(std::move(working));
	}

	if (!stats::succeeded(result.model)) {
		report(result.diagnostics, DiagnosticKind::FitFailure, species, year,
		       "flight curve model did not converge after " + std::to_string(result.trials) + " trials (" +
		           std::get<stats::FitFailure>(result.model).reason + ")");
		result.curve = curveFromWorkingData(result.data);
		return result;
	}

	const auto &model = std::get<stats::GamModel>(result.model);
	bool degenerate = false;
	std::unordered_map<std::string, double> site_sums;
	for (auto &row : result.data) {
		const double fitted = row.season.m_season == 0
		                          ? 0.0
		                          : model.predict(static_cast<double>(row.trim_day_no), levels.at(row.season.site_id));
		if (!std::isfinite(fitted)) {
			degenerate = true;
		}
		row.fitted = fitted;
		site_sums[row.season.site_id] += fitted;
	}

	for (const auto &entry : site_sums) {
		if (!std::isfinite(entry.second) || entry.second <= 0.0) {
			degenerate = true;
		}
	}

	if (degenerate) {
		clearFit(result.data);
		report(result.diagnostics, DiagnosticKind::NumericDegeneracy, species, year,
		       "flight curve predictions are not finite");
	} else {
		for (auto &row : result.data) {
			const double site_sum = site_sums.at(row.season.site_id);
			row.site_sum = site_sum;
			row.nm = roundTo5(*row.fitted / site_sum);
		}
	}

	result.curve = curveFromWorkingData(result.data);
	return result;
}

} // namespace phenoindex::pheno
