#include "pheno-index/pheno/abundance_imputer.hpp"

#include "pheno-index/core/errors.hpp"
#include "pheno-index/pheno/phenology_resolver.hpp"
#include "pheno-index/pheno/site_regression_fitter.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace phenoindex::pheno {

namespace {

using RowKey = std::pair<std::string, std::int64_t>;

bool wanted(const std::optional<std::vector<int>> &years, int year) {
	return !years || std::find(years->begin(), years->end(), year) != years->end();
}

} // namespace

void ImputerConfig::validate() const {
	if (model_family == stats::Family::NegativeBinomial) {
		throw core::InputContractError(
		    "The negative binomial is not supported for count imputation, use the quasi-Poisson family instead.");
	}
	if (solver_max_iterations < 1) {
		throw core::InputContractError("solver_max_iterations must be at least 1.");
	}
}

AbundanceImputer::AbundanceImputer(ImputerConfig config, std::shared_ptr<stats::IGlmSolver> solver)
    : config_(std::move(config)), solver_(std::move(solver)) {
	config_.validate();
	if (!solver_) {
		throw std::invalid_argument("AbundanceImputer requires a GLM solver.");
	}
}

ImputationResult AbundanceImputer::impute(const core::SeasonTable &input, const core::FlightCurveTable &curves) const {
	if (input.speciesList().size() > 1) {
		throw core::InputContractError("Counts are imputed one species at a time.");
	}
	const auto &curve_species = curves.species();
	const bool mixed_curves =
	    std::any_of(curves.points().begin(), curves.points().end(),
	                [&curve_species](const core::FlightCurvePoint &point) { return point.species != curve_species; });
	if (mixed_curves) {
		throw core::InputContractError("Flight curve table holds more than one species.");
	}
	if (input.species() != curves.species()) {
		throw core::InputContractError("Species in count data (" + input.species() + ") and flight curve (" +
		                               curves.species() + ") must be the same.");
	}

	const core::SeasonTable season = config_.restrict_to_complete_seasons ? input.completeSeasonsOnly() : input;

	std::map<core::TimePoint, const core::FlightCurvePoint *> curve_by_date;
	for (const auto &point : curves.points()) {
		curve_by_date.emplace(point.date, &point);
	}

	ImputationResult result;
	std::map<RowKey, std::size_t> position;
	result.imputed.reserve(season.size());
	for (const auto &row : season.rows()) {
		core::ImputedCount imputed;
		imputed.season = row;
		const auto found = curve_by_date.find(row.date);
		if (found != curve_by_date.end()) {
			imputed.trim_day_no = found->second->trim_day_no;
			imputed.nm = found->second->nm;
		}
		position.emplace(RowKey {row.site_id, row.day_since}, result.imputed.size());
		result.imputed.push_back(std::move(imputed));
	}

	const PhenologyResolver resolver;
	const SiteRegressionFitter fitter(solver_, SiteRegressionOptions {config_.model_family, config_.solver_max_iterations});

	for (int year : season.years()) {
		if (!wanted(config_.years, year)) {
			continue;
		}

		std::vector<core::ImputedCount> year_rows;
		std::copy_if(result.imputed.begin(), result.imputed.end(), std::back_inserter(year_rows),
		             [year](const core::ImputedCount &row) { return row.season.m_year == year; });

		if (config_.use_nearest_phenology) {
			resolver.resolve(year_rows, curves, result.diagnostics);
		}

		// Out-of-season counts neither enter the regression nor decide whether a site is zero.
		for (auto &row : year_rows) {
			if (row.season.m_season == 0) {
				row.season.count.reset();
			} else if (row.nm && *row.nm == 0.0) {
				row.nm = kMinimumNm;
			}
		}

		auto regression = fitter.fit(year_rows, result.diagnostics);

		for (const auto &row : year_rows) {
			auto &target = result.imputed[position.at(RowKey {row.season.site_id, row.season.day_since})];
			target.trim_day_no = row.trim_day_no;
			target.nm = row.nm;
			target.fitted = row.fitted;
			if (row.season.m_season == 0) {
				target.count_imputed = 0.0;
			} else if (row.season.count) {
				target.count_imputed = *row.season.count;
			} else {
				target.count_imputed = row.fitted;
			}
		}

		if (config_.retain_models) {
			result.models.insert_or_assign(core::ModelKey {season.species(), year}, std::move(regression.model));
		}
	}

	if (config_.years) {
		result.imputed.erase(std::remove_if(result.imputed.begin(), result.imputed.end(),
		                                    [this](const core::ImputedCount &row) {
			                                    return !wanted(config_.years, row.season.m_year);
		                                    }),
		                     result.imputed.end());
	}
	return result;
}

ImputationResult imputeCounts(const core::SeasonTable &season, const core::FlightCurveTable &curves,
                              const ImputerConfig &config) {
	return AbundanceImputer(config).impute(season, curves);
}

} // namespace phenoindex::pheno
