#include "pheno-index/pheno/index_aggregator.hpp"

#include "pheno-index/core/errors.hpp"

#include <map>
#include <tuple>

namespace phenoindex::pheno {

void AggregatorConfig::validate() const {
	if (canonical_week_day < 1 || canonical_week_day > 7) {
		throw core::InputContractError("canonical_week_day must be between 1 and 7.");
	}
}

IndexAggregator::IndexAggregator(AggregatorConfig config) : config_(config) {
	config_.validate();
}

std::vector<AbundanceIndex> IndexAggregator::aggregate(const std::vector<core::ImputedCount> &imputed) const {
	std::vector<AbundanceIndex> indices;
	std::map<std::tuple<std::string, std::string, int>, std::size_t> position;

	for (const auto &row : imputed) {
		const auto &season = row.season;
		if (!season.complete_season || season.m_season == 0) {
			continue;
		}
		if (config_.by_week && season.week_day != config_.canonical_week_day) {
			continue;
		}

		const auto key = std::make_tuple(season.species, season.site_id, season.m_year);
		auto found = position.find(key);
		if (found == position.end()) {
			found = position.emplace(key, indices.size()).first;
			indices.push_back(AbundanceIndex {season.species, season.site_id, season.m_year, 0.0});
		}

		auto &index = indices[found->second].abundance_index;
		const auto &value = config_.value == IndexValue::Fitted ? row.fitted : row.count_imputed;
		if (!index) {
			continue;
		}
		if (value) {
			*index += *value;
		} else {
			index.reset();
		}
	}
	return indices;
}

std::vector<AbundanceIndex> aggregate(const std::vector<core::ImputedCount> &imputed, bool by_week) {
	AggregatorConfig config;
	config.by_week = by_week;
	return IndexAggregator(config).aggregate(imputed);
}

} // namespace phenoindex::pheno
