#include "pheno-index/pheno/diagnostics.hpp"

#include "pheno-index/utils/logging.hpp"

#include <algorithm>
#include <utility>

namespace phenoindex::pheno {

std::string toString(DiagnosticKind kind) {
	switch (kind) {
	case DiagnosticKind::InsufficientSites:
		return "InsufficientSites";
	case DiagnosticKind::FitFailure:
		return "FitFailure";
	case DiagnosticKind::NumericDegeneracy:
		return "NumericDegeneracy";
	case DiagnosticKind::PhenologySubstituted:
		return "PhenologySubstituted";
	case DiagnosticKind::UnresolvedPhenology:
		return "UnresolvedPhenology";
	case DiagnosticKind::RegressionSkipped:
		return "RegressionSkipped";
	}
	return "Unknown";
}

void report(std::vector<Diagnostic> &sink, DiagnosticKind kind, const std::string &species, int year,
            std::string message) {
	PHENO_WARN("[{}] {} {}: {}", toString(kind), species, year, message);
	sink.push_back(Diagnostic {kind, species, year, std::move(message)});
}

std::size_t countOf(const std::vector<Diagnostic> &diagnostics, DiagnosticKind kind) {
	return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
	                                              [kind](const Diagnostic &d) { return d.kind == kind; }));
}

} // namespace phenoindex::pheno
