#include "pheno-index/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace phenoindex::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("pheno-index");
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt("pheno-index");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace phenoindex::utils
