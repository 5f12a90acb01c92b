#pragma once

#include <string>
#include <tuple>

namespace phenoindex::core {

/**
 * @brief Composite (species, year) key for retained fitted models.
 */
struct ModelKey {
	std::string species;
	int year = 0;

	/// Label such as "FlightModel_Pieris_napi_2019"; blanks in the species become underscores.
	std::string label(const std::string &prefix) const;

	bool operator<(const ModelKey &other) const {
		return std::tie(species, year) < std::tie(other.species, other.year);
	}
	bool operator==(const ModelKey &other) const {
		return species == other.species && year == other.year;
	}
};

} // namespace phenoindex::core
