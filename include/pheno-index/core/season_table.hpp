#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace phenoindex::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief One (site, date) row of a species' monitoring season.
 *
 * `day_since` increases strictly along each site's series. `m_season` is 0
 * outside the active flight season. `count` is empty on days without a visit.
 * `anchor` marks synthetic zero rows placed at the season boundaries and
 * `complete_season` flags site-years whose whole active season was sampled.
 */
struct SeasonCount {
	std::string species;
	std::string site_id;
	TimePoint date {};
	int week = 0;
	int week_day = 0;
	std::int64_t day_since = 0;
	int m_year = 0;
	int m_season = 0;
	std::optional<double> count;
	bool anchor = false;
	bool complete_season = false;
};

/**
 * @class SeasonTable
 * @brief Immutable per-site daily/weekly count table for one or more species.
 *
 * Tables are either built from records or from named columns. Column names are
 * matched case-insensitively; SPECIES, SITE_ID, DATE, WEEK, WEEK_DAY,
 * DAY_SINCE, M_YEAR, M_SEASON, COUNT, ANCHOR and COMPLT_SEASON must all be
 * present.
 */
class SeasonTable {
public:
	using Column = std::variant<std::vector<std::string>, std::vector<TimePoint>, std::vector<std::int64_t>,
	                            std::vector<std::optional<double>>>;
	using NamedColumn = std::pair<std::string, Column>;

	SeasonTable() = default;
	explicit SeasonTable(std::vector<SeasonCount> rows);

	/**
	 * @brief Builds a table from named columns.
	 *
	 * Text columns (SPECIES, SITE_ID) are string vectors, DATE is a time point
	 * vector, COUNT is a nullable double vector and every other column is an
	 * integer vector.
	 *
	 * @throws InputContractError if a column is missing, mistyped or of a
	 *         different length than the others.
	 */
	static SeasonTable fromColumns(std::vector<NamedColumn> columns);

	static const std::vector<std::string> &requiredColumns();
	static std::string normalizeColumnName(std::string name);

	const std::vector<SeasonCount> &rows() const {
		return rows_;
	}
	std::size_t size() const {
		return rows_.size();
	}
	bool empty() const {
		return rows_.empty();
	}

	/// Species of the first row.
	const std::string &species() const;
	std::vector<std::string> speciesList() const;
	/// Distinct monitoring years in order of first appearance.
	std::vector<int> years() const;
	std::vector<std::string> sites() const;

	SeasonTable completeSeasonsOnly() const;
	SeasonTable forSpecies(const std::string &species) const;
	SeasonTable forYears(const std::vector<int> &years) const;

private:
	void validate() const;

	std::vector<SeasonCount> rows_;
};

} // namespace phenoindex::core
