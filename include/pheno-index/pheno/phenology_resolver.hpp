#pragma once

#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/pheno/diagnostics.hpp"

#include <optional>
#include <vector>

namespace phenoindex::pheno {

/**
 * @class PhenologyResolver
 * @brief Substitutes the flight curve of the nearest complete year.
 *
 * Candidates are tried at offsets -1, +1, -2, +2, ... up to the horizon and
 * must lie strictly between the first and last year of the curve table.
 */
class PhenologyResolver {
public:
	explicit PhenologyResolver(int horizon = 5);

	/// Candidate donor years of `year`, in search order.
	std::vector<int> candidateYears(int year, const core::FlightCurveTable &curves) const;

	/// First candidate whose curve is complete.
	std::optional<int> findDonorYear(int year, const core::FlightCurveTable &curves) const;

	/**
	 * @brief Fills the NM of one year's rows from a donor year when any is missing.
	 *
	 * Donor values are joined by trimmed day number; no other field changes.
	 * Rows without a trimmed day number get one re-based on the smallest
	 * day_since of the year.
	 *
	 * @return The donor year, or nothing when no substitution was made.
	 */
	std::optional<int> resolve(std::vector<core::ImputedCount> &year_rows, const core::FlightCurveTable &curves,
	                           std::vector<Diagnostic> &diagnostics) const;

	int horizon() const {
		return horizon_;
	}

private:
	int horizon_;
};

/// True if some row lacks NM.
bool hasMissingPhenology(const std::vector<core::ImputedCount> &rows);

} // namespace phenoindex::pheno
