#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace demandstats::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * All components log through one logger named "demand-stats", which the host
 * application may configure once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance, creating it on first use.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace demandstats::utils

#define DEMANDSTATS_TRACE(...)    demandstats::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DEMANDSTATS_DEBUG(...)    demandstats::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DEMANDSTATS_INFO(...)     demandstats::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DEMANDSTATS_WARN(...)     demandstats::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DEMANDSTATS_ERROR(...)    demandstats::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DEMANDSTATS_CRITICAL(...) demandstats::utils::Logging::getLogger()->critical(__VA_ARGS__)
