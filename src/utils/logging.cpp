#include "gapfill/utils/logging.hpp"

#ifndef GAPFILL_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>
#include <string>

namespace gapfill::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("gapfill");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("gapfill");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

void Logging::init(const std::string &level_name) {
	init(parseLevel(level_name));
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	const auto level = spdlog::level::from_str(name);
	// from_str maps unknown names to "off"; only accept "off" when asked for it.
	if (level == spdlog::level::off && name != "off") {
		throw std::invalid_argument("Unknown log level '" + name + "'.");
	}
	return level;
}

} // namespace gapfill::utils

#endif // GAPFILL_NO_LOGGING
