#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/core/model_key.hpp"
#include "pheno-index/core/season_table.hpp"
#include "pheno-index/pheno/diagnostics.hpp"
#include "pheno-index/stats/glm.hpp"

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace phenoindex::pheno {

/**
 * @brief Settings of the count imputation.
 */
struct ImputerConfig {
	/// The negative binomial is not supported here.
	stats::Family model_family = stats::Family::QuasiPoisson;
	bool restrict_to_complete_seasons = true;
	/// Years to impute and report; every year of the table when empty.
	std::optional<std::vector<int>> years;
	bool use_nearest_phenology = true;
	bool retain_models = true;
	int solver_max_iterations = 100;

	/// @throws core::InputContractError for the negative binomial or a non-positive iteration cap.
	void validate() const;
};

struct ImputationResult {
	/// Season rows with the joined curve, fitted values and imputed counts.
	std::vector<core::ImputedCount> imputed;
	/// Site regressions keyed by (species, year); empty unless models are retained.
	std::map<core::ModelKey, stats::GlmFitResult> models;
	std::vector<Diagnostic> diagnostics;
};

/**
 * @class AbundanceImputer
 * @brief Imputes site counts from the flight curve, one year at a time.
 *
 * The imputed count is zero outside the season, the observed count where
 * there is one and the fitted value otherwise.
 */
class AbundanceImputer {
public:
	explicit AbundanceImputer(ImputerConfig config = {},
	                          std::shared_ptr<stats::IGlmSolver> solver = std::make_shared<stats::GlmSolver>());

	/**
	 * @throws core::InputContractError if the tables hold different species.
	 */
	ImputationResult impute(const core::SeasonTable &season, const core::FlightCurveTable &curves) const;

	const ImputerConfig &config() const {
		return config_;
	}

private:
	ImputerConfig config_;
	std::shared_ptr<stats::IGlmSolver> solver_;
};

/// Smallest in-season NM handed to the log offset.
constexpr double kMinimumNm = 1e-6;

ImputationResult imputeCounts(const core::SeasonTable &season, const core::FlightCurveTable &curves,
                              const ImputerConfig &config = {});

} // namespace phenoindex::pheno
