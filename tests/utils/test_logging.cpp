#include <catch2/catch_test_macros.hpp>

#include "pheno-index/pheno/diagnostics.hpp"
#include "pheno-index/utils/logging.hpp"

#include <spdlog/spdlog.h>

using phenoindex::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "pheno-index");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Diagnostics are recorded and counted by kind", "[utils][logging]") {
	using phenoindex::pheno::DiagnosticKind;

	std::vector<phenoindex::pheno::Diagnostic> sink;
	phenoindex::pheno::report(sink, DiagnosticKind::UnresolvedPhenology, "Pieris napi", 2014, "no donor");
	phenoindex::pheno::report(sink, DiagnosticKind::FitFailure, "Pieris napi", 2015, "did not converge");
	phenoindex::pheno::report(sink, DiagnosticKind::FitFailure, "Pieris napi", 2016, "did not converge");

	REQUIRE(sink.size() == 3);
	REQUIRE(sink.front().year == 2014);
	REQUIRE(sink.front().message == "no donor");
	REQUIRE(phenoindex::pheno::countOf(sink, DiagnosticKind::FitFailure) == 2);
	REQUIRE(phenoindex::pheno::countOf(sink, DiagnosticKind::InsufficientSites) == 0);
	REQUIRE(phenoindex::pheno::toString(DiagnosticKind::PhenologySubstituted) == "PhenologySubstituted");
}
