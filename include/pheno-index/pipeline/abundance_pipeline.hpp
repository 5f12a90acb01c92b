#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/core/model_key.hpp"
#include "pheno-index/core/season_table.hpp"
#include "pheno-index/pheno/abundance_imputer.hpp"
#include "pheno-index/pheno/curve_estimator.hpp"
#include "pheno-index/pheno/diagnostics.hpp"
#include "pheno-index/pheno/index_aggregator.hpp"

#include <map>
#include <memory>
#include <vector>

namespace phenoindex::pipeline {

struct PipelineConfig {
	pheno::CurveEstimatorConfig curves;
	pheno::ImputerConfig imputation;
	pheno::AggregatorConfig aggregation;

	void validate() const;
};

struct PipelineResult {
	core::FlightCurveTable curves;
	std::vector<pheno::CurveWorkingRow> curve_data;
	std::vector<core::ImputedCount> imputed;
	std::vector<pheno::AbundanceIndex> indices;
	std::map<core::ModelKey, stats::GamFitResult> curve_models;
	std::map<core::ModelKey, stats::GlmFitResult> regression_models;
	std::vector<pheno::Diagnostic> diagnostics;
};

/**
 * @class AbundancePipeline
 * @brief Runs curve estimation, imputation and aggregation for every species of a table.
 *
 * Species are processed in order of first appearance. All curves of a
 * species are estimated before any of its years is imputed.
 */
class AbundancePipeline {
public:
	explicit AbundancePipeline(PipelineConfig config = {},
	                           std::shared_ptr<stats::ICurveSolver> curve_solver = std::make_shared<stats::GamSolver>(),
	                           std::shared_ptr<stats::IGlmSolver> glm_solver = std::make_shared<stats::GlmSolver>());

	PipelineResult run(const core::SeasonTable &table) const;

private:
	PipelineConfig config_;
	pheno::CurveEstimator estimator_;
	pheno::AbundanceImputer imputer_;
	pheno::IndexAggregator aggregator_;
};

} // namespace phenoindex::pipeline
