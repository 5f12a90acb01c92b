#pragma once

#include "pheno-index/core/flight_curve.hpp"

#include <optional>
#include <string>
#include <vector>

namespace phenoindex::pheno {

/// Column summed into the index.
enum class IndexValue {
	Fitted,
	Imputed
};

struct AggregatorConfig {
	/// Sum one canonical weekday per week instead of every day.
	bool by_week = true;
	int canonical_week_day = 4;
	IndexValue value = IndexValue::Fitted;

	/// @throws core::InputContractError if the weekday is outside 1..7.
	void validate() const;
};

/**
 * @brief Abundance index (butterfly-days) of one site-year.
 *
 * Empty when a contributing value is missing.
 */
struct AbundanceIndex {
	std::string species;
	std::string site_id;
	int m_year = 0;
	std::optional<double> abundance_index;
};

/**
 * @class IndexAggregator
 * @brief Reduces imputed counts to one index per site-year.
 *
 * Only in-season rows of complete seasons count.
 */
class IndexAggregator {
public:
	explicit IndexAggregator(AggregatorConfig config = {});

	/// One row per (species, site, year), in order of first appearance.
	std::vector<AbundanceIndex> aggregate(const std::vector<core::ImputedCount> &imputed) const;

	const AggregatorConfig &config() const {
		return config_;
	}

private:
	AggregatorConfig config_;
};

std::vector<AbundanceIndex> aggregate(const std::vector<core::ImputedCount> &imputed, bool by_week = true);

} // namespace phenoindex::pheno
