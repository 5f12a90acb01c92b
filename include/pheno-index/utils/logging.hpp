#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace phenoindex::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the "pheno-index" spdlog logger.
 *
 * Every estimation stage reports progress and non-fatal conditions (failed
 * fits, substituted phenology, skipped regressions) through this logger.
 * The logger is created on first use at info level.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Sets the minimum level (and flush level) of the shared logger.
	 * @param level The minimum level of messages to emit.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace phenoindex::utils

#define PHENO_TRACE(...)    phenoindex::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define PHENO_DEBUG(...)    phenoindex::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define PHENO_INFO(...)     phenoindex::utils::Logging::getLogger()->info(__VA_ARGS__)
#define PHENO_WARN(...)     phenoindex::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define PHENO_ERROR(...)    phenoindex::utils::Logging::getLogger()->error(__VA_ARGS__)
#define PHENO_CRITICAL(...) phenoindex::utils::Logging::getLogger()->critical(__VA_ARGS__)
