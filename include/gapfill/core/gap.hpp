#pragma once

#include "gapfill/core/config.hpp"
#include "gapfill/core/parameter.hpp"
#include "gapfill/core/time.hpp"

#include <cstdint>
#include <string>

namespace gapfill::core {

enum class DurationClass {
	Short,
	Medium,
	Long
};

/**
 * @brief Maps a gap length in hours to its duration class; both thresholds are inclusive.
 * @throws std::invalid_argument if @p hours is not positive.
 */
DurationClass classifyGap(std::int64_t hours, const GapConfig &config = GapConfig{});

std::string durationClassName(DurationClass duration_class);

/**
 * @struct Gap
 * @brief A maximal run of missing hours for one station and parameter.
 *
 * Derived on demand, never persisted. @c start and @c end are the first and
 * last missing hours (both inclusive).
 */
struct Gap {
	std::string station_id;
	Parameter parameter = Parameter::PM25;
	TimePoint start{};
	TimePoint end{};
	DurationClass duration_class = DurationClass::Short;

	std::int64_t hours() const {
		return hoursBetween(start, end) + 1;
	}

	/// Long gaps are flagged only and never reach the predictor.
	bool isFillable() const {
		return duration_class != DurationClass::Long;
	}

	bool contains(TimePoint tp) const {
		return tp >= start && tp <= end;
	}
};

} // namespace gapfill::core
