#include "pheno-index/core/flight_curve.hpp"

#include "pheno-index/core/errors.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace phenoindex::core {

void FlightCurveTable::append(const std::vector<FlightCurvePoint> &points) {
	points_.insert(points_.end(), points.begin(), points.end());
}

const std::string &FlightCurveTable::species() const {
	if (points_.empty()) {
		throw InputContractError("Flight curve table is empty.");
	}
	return points_.front().species;
}

std::vector<int> FlightCurveTable::years() const {
	std::set<int> years;
	for (const auto &point : points_) {
		years.insert(point.m_year);
	}
	return {years.begin(), years.end()};
}

std::vector<FlightCurvePoint> FlightCurveTable::forYear(int year) const {
	std::vector<FlightCurvePoint> result;
	std::copy_if(points_.begin(), points_.end(), std::back_inserter(result),
	             [year](const FlightCurvePoint &point) { return point.m_year == year; });
	return result;
}

bool FlightCurveTable::hasYear(int year) const {
	return std::any_of(points_.begin(), points_.end(),
	                   [year](const FlightCurvePoint &point) { return point.m_year == year; });
}

bool FlightCurveTable::isComplete(int year) const {
	bool found = false;
	for (const auto &point : points_) {
		if (point.m_year != year) {
			continue;
		}
		if (!point.nm) {
			return false;
		}
		found = true;
	}
	return found;
}

std::optional<double> FlightCurveTable::totalNm(int year) const {
	if (!isComplete(year)) {
		return std::nullopt;
	}
	double total = 0.0;
	for (const auto &point : points_) {
		if (point.m_year == year) {
			total += *point.nm;
		}
	}
	return total;
}

} // namespace phenoindex::core
