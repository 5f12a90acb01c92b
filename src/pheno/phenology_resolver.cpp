#include "pheno-index/pheno/phenology_resolver.hpp"

#include "pheno-index/core/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_map>

namespace phenoindex::pheno {

bool hasMissingPhenology(const std::vector<core::ImputedCount> &rows) {
	return std::any_of(rows.begin(), rows.end(), [](const core::ImputedCount &row) { return !row.nm; });
}

PhenologyResolver::PhenologyResolver(int horizon) : horizon_(horizon) {
	if (horizon_ < 1) {
		throw core::InputContractError("Phenology search horizon must be at least one year.");
	}
}

std::vector<int> PhenologyResolver::candidateYears(int year, const core::FlightCurveTable &curves) const {
	const auto years = curves.years();
	if (years.empty()) {
		return {};
	}
	const int first = years.front();
	const int last = years.back();

	std::vector<int> candidates;
	for (int offset = 1; offset <= horizon_; ++offset) {
		for (int candidate : {year - offset, year + offset}) {
			if (candidate > first && candidate < last) {
				candidates.push_back(candidate);
			}
		}
	}
	return candidates;
}

std::optional<int> PhenologyResolver::findDonorYear(int year, const core::FlightCurveTable &curves) const {
	for (int candidate : candidateYears(year, curves)) {
		if (curves.isComplete(candidate)) {
			return candidate;
		}
	}
	return std::nullopt;
}

std::optional<int> PhenologyResolver::resolve(std::vector<core::ImputedCount> &year_rows,
                                              const core::FlightCurveTable &curves,
                                              std::vector<Diagnostic> &diagnostics) const {
	if (year_rows.empty() || !hasMissingPhenology(year_rows)) {
		return std::nullopt;
	}

	const std::string &species = year_rows.front().season.species;
	const int year = year_rows.front().season.m_year;

	const auto donor = findDonorYear(year, curves);
	if (!donor) {
		report(diagnostics, DiagnosticKind::UnresolvedPhenology, species, year,
		       "no reliable flight curve available within a " + std::to_string(horizon_) + " year horizon");
		return std::nullopt;
	}

	std::unordered_map<int, std::optional<double>> donor_nm;
	for (const auto &point : curves.forYear(*donor)) {
		donor_nm.emplace(point.trim_day_no, point.nm);
	}

	std::int64_t first_day = year_rows.front().season.day_since;
	for (const auto &row : year_rows) {
		first_day = std::min(first_day, row.season.day_since);
	}

	for (auto &row : year_rows) {
		if (!row.trim_day_no) {
			row.trim_day_no = static_cast<int>(row.season.day_since - first_day + 1);
		}
		const auto found = donor_nm.find(*row.trim_day_no);
		row.nm = found == donor_nm.end() ? std::nullopt : found->second;
	}

	report(diagnostics, DiagnosticKind::PhenologySubstituted, species, year,
	       "used the flight curve of " + std::to_string(*donor) + " to compute abundance indices");
	return donor;
}

} // namespace phenoindex::pheno
