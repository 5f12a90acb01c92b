#pragma once

#include "pheno-index/core/season_table.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace phenoindex::core {

/**
 * @brief Normalised relative abundance for one (species, year, day).
 *
 * Over a successfully estimated (species, year) the `nm` values sum to one.
 * A year whose estimation failed carries no `nm` at all.
 */
struct FlightCurvePoint {
	std::string species;
	TimePoint date {};
	int week = 0;
	int week_day = 0;
	std::int64_t day_since = 0;
	int m_year = 0;
	int m_season = 0;
	int trim_day_no = 0;
	std::optional<double> nm;
};

/**
 * @class FlightCurveTable
 * @brief Multi-year flight curve table, one point per (species, year, day).
 */
class FlightCurveTable {
public:
	FlightCurveTable() = default;
	explicit FlightCurveTable(std::vector<FlightCurvePoint> points) : points_(std::move(points)) {
	}

	void append(const std::vector<FlightCurvePoint> &points);
	void append(const FlightCurveTable &other) {
		append(other.points_);
	}

	const std::vector<FlightCurvePoint> &points() const {
		return points_;
	}
	std::size_t size() const {
		return points_.size();
	}
	bool empty() const {
		return points_.empty();
	}

	/// Species of the first point.
	const std::string &species() const;
	/// Distinct years, ascending.
	std::vector<int> years() const;
	std::vector<FlightCurvePoint> forYear(int year) const;
	bool hasYear(int year) const;

	/// True if the year has at least one point and none of them lacks `nm`.
	bool isComplete(int year) const;

	/// Sum of `nm` over the year, empty when the year is absent or incomplete.
	std::optional<double> totalNm(int year) const;

private:
	std::vector<FlightCurvePoint> points_;
};

/**
 * @brief Season row extended with the joined flight curve and imputation.
 */
struct ImputedCount {
	SeasonCount season;
	std::optional<int> trim_day_no;
	std::optional<double> nm;
	std::optional<double> fitted;
	std::optional<double> count_imputed;
};

} // namespace phenoindex::core
