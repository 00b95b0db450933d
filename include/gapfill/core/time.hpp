#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gapfill::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Hours = std::chrono::hours;

constexpr Hours kOneHour{1};

/// Seconds since the Unix epoch, the representation used by the persistent stores.
std::int64_t toEpochSeconds(TimePoint tp);
TimePoint fromEpochSeconds(std::int64_t seconds);

/// Truncates a time point to the start of its UTC hour.
TimePoint floorToHour(TimePoint tp);

/// True when the time point lies exactly on an hour boundary.
bool isHourAligned(TimePoint tp);

/// Whole hours between two time points (end - start), truncated towards zero.
std::int64_t hoursBetween(TimePoint start, TimePoint end);

/// ISO-8601 UTC rendering ("2024-03-01T05:00:00Z") used in logs.
std::string formatTimestamp(TimePoint tp);

} // namespace gapfill::core
