#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/season_fixtures.hpp"
#include "pheno-index/core/errors.hpp"
#include "pheno-index/core/flight_curve.hpp"
#include "pheno-index/core/model_key.hpp"

#include <iterator>
#include <map>

using phenoindex::core::FlightCurveTable;
using phenoindex::core::ModelKey;

TEST_CASE("FlightCurveTable reports completeness per year", "[core][flight_curve]") {
	tests::helpers::SeasonSpec spec;
	spec.years = {2012, 2013, 2014};

	FlightCurveTable curves;
	curves.append(tests::helpers::makeCurve(spec, 2014));
	curves.append(tests::helpers::makeCurve(spec, 2012));
	curves.append(tests::helpers::makeCurve(spec, 2013, true));

	REQUIRE(curves.years() == std::vector<int> {2012, 2013, 2014});
	REQUIRE(curves.species() == "Pieris napi");
	REQUIRE(curves.isComplete(2012));
	REQUIRE_FALSE(curves.isComplete(2013));
	REQUIRE_FALSE(curves.isComplete(2020));
	REQUIRE(curves.hasYear(2013));
	REQUIRE_FALSE(curves.hasYear(2020));
	REQUIRE(curves.forYear(2014).size() == static_cast<std::size_t>(spec.season_length));

	REQUIRE(curves.totalNm(2012).value() == Catch::Approx(1.0));
	REQUIRE_FALSE(curves.totalNm(2013).has_value());
}

TEST_CASE("Empty FlightCurveTable has no species", "[core][flight_curve]") {
	const FlightCurveTable curves;
	REQUIRE(curves.empty());
	REQUIRE(curves.years().empty());
	REQUIRE_THROWS_AS(curves.species(), phenoindex::core::InputContractError);
}

TEST_CASE("ModelKey labels and orders models", "[core][model_key]") {
	const ModelKey key {"Pieris napi", 2019};
	REQUIRE(key.label("FlightModel") == "FlightModel_Pieris_napi_2019");
	REQUIRE(key.label("glm_mod") == "glm_mod_Pieris_napi_2019");

	std::map<ModelKey, int> models;
	models.emplace(ModelKey {"Pieris napi", 2020}, 2);
	models.emplace(key, 1);
	models.emplace(ModelKey {"Aglais io", 2021}, 3);
	REQUIRE(models.begin()->first.species == "Aglais io");
	REQUIRE(std::next(models.begin())->second == 1);
	REQUIRE(ModelKey {"Pieris napi", 2019} == key);
}
