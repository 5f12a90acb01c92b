#include "pheno-index/pipeline/abundance_pipeline.hpp"

#include "pheno-index/utils/logging.hpp"

#include <iterator>
#include <utility>

namespace phenoindex::pipeline {

void PipelineConfig::validate() const {
	curves.validate();
	imputation.validate();
	aggregation.validate();
}

AbundancePipeline::AbundancePipeline(PipelineConfig config, std::shared_ptr<stats::ICurveSolver> curve_solver,
                                     std::shared_ptr<stats::IGlmSolver> glm_solver)
    : config_(std::move(config)), estimator_(config_.curves, std::move(curve_solver)),
      imputer_(config_.imputation, std::move(glm_solver)), aggregator_(config_.aggregation) {
}

PipelineResult AbundancePipeline::run(const core::SeasonTable &table) const {
	PipelineResult result;
	const auto species_list = table.speciesList();
	PHENO_INFO("Estimating abundance indices for {} species", species_list.size());

	for (const auto &species : species_list) {
		const auto species_table = table.forSpecies(species);

		auto estimate = estimator_.estimate(species_table);
		result.diagnostics.insert(result.diagnostics.end(), estimate.diagnostics.begin(),
		                          estimate.diagnostics.end());
		if (estimate.curves.empty()) {
			PHENO_WARN("No flight curve could be built for {}, skipping its imputation", species);
			continue;
		}

		auto imputation = imputer_.impute(species_table, estimate.curves);
		result.diagnostics.insert(result.diagnostics.end(), imputation.diagnostics.begin(),
		                          imputation.diagnostics.end());

		const auto indices = aggregator_.aggregate(imputation.imputed);
		result.indices.insert(result.indices.end(), indices.begin(), indices.end());

		result.curves.append(estimate.curves);
		result.curve_data.insert(result.curve_data.end(), std::make_move_iterator(estimate.data.begin()),
		                         std::make_move_iterator(estimate.data.end()));
		result.imputed.insert(result.imputed.end(), std::make_move_iterator(imputation.imputed.begin()),
		                      std::make_move_iterator(imputation.imputed.end()));
		for (auto &entry : estimate.models) {
			result.curve_models.insert_or_assign(entry.first, std::move(entry.second));
		}
		for (auto &entry : imputation.models) {
			result.regression_models.insert_or_assign(entry.first, std::move(entry.second));
		}
	}
	return result;
}

} // namespace phenoindex::pipeline
