#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace phenoindex::pheno {

enum class DiagnosticKind {
	InsufficientSites,
	FitFailure,
	NumericDegeneracy,
	PhenologySubstituted,
	UnresolvedPhenology,
	RegressionSkipped
};

/**
 * @brief A non-fatal condition met while processing one (species, year).
 */
struct Diagnostic {
	DiagnosticKind kind;
	std::string species;
	int year = 0;
	std::string message;
};

std::string toString(DiagnosticKind kind);

/**
 * @brief Logs the condition as a warning and appends it to `sink`.
 */
void report(std::vector<Diagnostic> &sink, DiagnosticKind kind, const std::string &species, int year,
            std::string message);

/// Number of diagnostics of the given kind.
std::size_t countOf(const std::vector<Diagnostic> &diagnostics, DiagnosticKind kind);

} // namespace phenoindex::pheno
