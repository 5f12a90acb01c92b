#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "common/season_fixtures.hpp"
#include "pheno-index/core/errors.hpp"
#include "pheno-index/core/season_table.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using phenoindex::core::InputContractError;
using phenoindex::core::SeasonTable;
using phenoindex::core::TimePoint;

namespace {

std::vector<SeasonTable::NamedColumn> twoRowColumns() {
	using Ints = std::vector<std::int64_t>;
	return {
	    {"species", std::vector<std::string> {"Pieris napi", "Pieris napi"}},
	    {"Site_Id", std::vector<std::string> {"S1", "S1"}},
	    {"DATE", std::vector<TimePoint> {tests::helpers::dayPoint(0), tests::helpers::dayPoint(1)}},
	    {"week", Ints {1, 1}},
	    {"week_day", Ints {1, 2}},
	    {"day_since", Ints {0, 1}},
	    {"m_year", Ints {2015, 2015}},
	    {"m_season", Ints {0, 1}},
	    {"count", std::vector<std::optional<double>> {std::nullopt, 3.0}},
	    {"anchor", Ints {1, 0}},
	    {"complt_season", Ints {1, 1}},
	};
}

} // namespace

TEST_CASE("SeasonTable builds rows from case-insensitive columns", "[core][season_table]") {
	const auto table = SeasonTable::fromColumns(twoRowColumns());

	REQUIRE(table.size() == 2);
	const auto &rows = table.rows();
	REQUIRE(rows[0].species == "Pieris napi");
	REQUIRE(rows[0].anchor);
	REQUIRE_FALSE(rows[0].count.has_value());
	REQUIRE(rows[1].count == 3.0);
	REQUIRE(rows[1].m_season == 1);
	REQUIRE(rows[1].complete_season);
	REQUIRE(table.species() == "Pieris napi");
}

TEST_CASE("SeasonTable names every missing column", "[core][season_table]") {
	auto columns = twoRowColumns();
	columns.erase(columns.begin() + 3);  // week
	columns.pop_back();                  // complt_season

	REQUIRE_THROWS_AS(SeasonTable::fromColumns(columns), InputContractError);
	REQUIRE_THROWS_WITH(SeasonTable::fromColumns(columns),
	                    Catch::Matchers::ContainsSubstring("WEEK") &&
	                        Catch::Matchers::ContainsSubstring("COMPLT_SEASON"));
}

TEST_CASE("SeasonTable rejects mistyped and ragged columns", "[core][season_table]") {
	SECTION("count stored as integers") {
		auto columns = twoRowColumns();
		columns[8].second = std::vector<std::int64_t> {0, 3};
		REQUIRE_THROWS_AS(SeasonTable::fromColumns(columns), InputContractError);
	}
	SECTION("column of a different length") {
		auto columns = twoRowColumns();
		columns[3].second = std::vector<std::int64_t> {1};
		REQUIRE_THROWS_AS(SeasonTable::fromColumns(columns), InputContractError);
	}
	SECTION("column given twice under different cases") {
		auto columns = twoRowColumns();
		columns.emplace_back("Week", std::vector<std::int64_t> {1, 1});
		REQUIRE_THROWS_AS(SeasonTable::fromColumns(columns), InputContractError);
	}
}

TEST_CASE("SeasonTable rejects repeated days within a site", "[core][season_table]") {
	auto rows = tests::helpers::makeSeasonRows(tests::helpers::SeasonSpec {});
	rows.push_back(rows.front());
	REQUIRE_THROWS_AS(SeasonTable(rows), InputContractError);
}

TEST_CASE("SeasonTable selects species, years and complete seasons", "[core][season_table]") {
	tests::helpers::SeasonSpec spec;
	spec.years = {2014, 2012, 2013};
	auto rows = tests::helpers::makeSeasonRows(spec);

	tests::helpers::SeasonSpec other;
	other.species = "Aglais io";
	other.complete = false;
	other.years = {2016};
	for (auto row : tests::helpers::makeSeasonRows(other)) {
		row.day_since += 10000;
		rows.push_back(row);
	}
	const SeasonTable table(rows);

	REQUIRE(table.speciesList() == std::vector<std::string> {"Pieris napi", "Aglais io"});
	REQUIRE(table.years() == std::vector<int> {2014, 2012, 2013, 2016});
	REQUIRE(table.sites() == std::vector<std::string> {"S1", "S2", "S3"});

	const auto complete = table.completeSeasonsOnly();
	REQUIRE(complete.speciesList() == std::vector<std::string> {"Pieris napi"});

	const auto selected = table.forSpecies("Pieris napi").forYears({2013});
	REQUIRE(selected.years() == std::vector<int> {2013});
	REQUIRE(selected.size() == spec.sites.size() * static_cast<std::size_t>(spec.season_length));
}

TEST_CASE("Empty SeasonTable has no species", "[core][season_table]") {
	const SeasonTable table;
	REQUIRE(table.empty());
	REQUIRE_THROWS_AS(table.species(), InputContractError);
}
