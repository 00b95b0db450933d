#include "gapfill/core/gap.hpp"

#include <stdexcept>

namespace gapfill::core {

DurationClass classifyGap(std::int64_t hours, const GapConfig &config) {
	if (hours <= 0) {
		throw std::invalid_argument("Gap duration must be at least one hour.");
	}
	if (hours <= config.short_gap_max_h) {
		return DurationClass::Short;
	}
	if (hours <= config.medium_gap_max_h) {
		return DurationClass::Medium;
	}
	return DurationClass::Long;
}

std::string durationClassName(DurationClass duration_class) {
	switch (duration_class) {
	case DurationClass::Short:
		return "short";
	case DurationClass::Medium:
		return "medium";
	case DurationClass::Long:
		return "long";
	}
	return "unknown";
}

} // namespace gapfill::core
