#include "gapfill/core/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace gapfill::core {

std::int64_t toEpochSeconds(TimePoint tp) {
	return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochSeconds(std::int64_t seconds) {
	return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::seconds{seconds})};
}

TimePoint floorToHour(TimePoint tp) {
	const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	std::int64_t hours = since_epoch / 3600;
	if (since_epoch < 0 && since_epoch % 3600 != 0) {
		--hours;
	}
	return fromEpochSeconds(hours * 3600);
}

bool isHourAligned(TimePoint tp) {
	return floorToHour(tp) == tp;
}

std::int64_t hoursBetween(TimePoint start, TimePoint end) {
	return std::chrono::duration_cast<Hours>(end - start).count();
}

std::string formatTimestamp(TimePoint tp) {
	const std::time_t raw = static_cast<std::time_t>(toEpochSeconds(tp));
	std::tm utc{};
#if defined(_WIN32)
	gmtime_s(&utc, &raw);
#else
	gmtime_r(&raw, &utc);
#endif
	std::ostringstream out;
	out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
	return out.str();
}

} // namespace gapfill::core
