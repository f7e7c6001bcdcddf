#include "demand-stats/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace demandstats::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("demand-stats");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("demand-stats");
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

} // namespace demandstats::utils
