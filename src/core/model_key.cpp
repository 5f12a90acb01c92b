#include "pheno-index/core/model_key.hpp"

#include <algorithm>

namespace phenoindex::core {

std::string ModelKey::label(const std::string &prefix) const {
	std::string name = species;
	std::replace(name.begin(), name.end(), ' ', '_');
	return prefix + "_" + name + "_" + std::to_string(year);
}

} // namespace phenoindex::core
