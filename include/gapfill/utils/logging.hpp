#pragma once

#ifndef GAPFILL_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace gapfill::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the engine logs through the same named logger so that an
 * embedding service can redirect or silence it in one place.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/// Same as init(parseLevel(level_name)).
	static void init(const std::string &level_name);

	/**
	 * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
	 * @throws std::invalid_argument for unknown names.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace gapfill::utils

// --- Logger Macros for convenient access ---
#define GAPFILL_TRACE(...)    gapfill::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define GAPFILL_DEBUG(...)    gapfill::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define GAPFILL_INFO(...)     gapfill::utils::Logging::getLogger()->info(__VA_ARGS__)
#define GAPFILL_WARN(...)     gapfill::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define GAPFILL_ERROR(...)    gapfill::utils::Logging::getLogger()->error(__VA_ARGS__)
#define GAPFILL_CRITICAL(...) gapfill::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not available

namespace gapfill::utils {

class Logging {
public:
	static void init() {}
	static void init(const std::string &) {}
};

} // namespace gapfill::utils

#define GAPFILL_TRACE(...)    do {} while(0)
#define GAPFILL_DEBUG(...)    do {} while(0)
#define GAPFILL_INFO(...)     do {} while(0)
#define GAPFILL_WARN(...)     do {} while(0)
#define GAPFILL_ERROR(...)    do {} while(0)
#define GAPFILL_CRITICAL(...) do {} while(0)

#endif // GAPFILL_NO_LOGGING
