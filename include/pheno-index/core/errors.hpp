#pragma once

#include <stdexcept>
#include <string>

namespace phenoindex::core {

/**
 * @brief Fatal violation of an input contract.
 *
 * Raised for missing or mistyped season-table columns, species mismatches
 * between joined tables, unsupported model families and invalid
 * configuration values. No partial result is produced.
 */
class InputContractError : public std::invalid_argument {
public:
	explicit InputContractError(const std::string &message) : std::invalid_argument(message) {
	}
};

} // namespace phenoindex::core
