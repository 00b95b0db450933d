#include "gapfill/imputation/baselines.hpp"

#include <algorithm>
#include <chrono>

namespace gapfill::imputation {

namespace {

core::HourlySeries::const_iterator firstAtOrAfter(const core::HourlySeries &series, core::TimePoint target) {
	return std::lower_bound(series.begin(), series.end(), target,
	                        [](const core::HourlyValue &p, core::TimePoint t) { return p.timestamp < t; });
}

} // namespace

std::optional<BaselineEstimate> linearInterpolate(const core::HourlySeries &series, core::TimePoint target) {
	auto after = firstAtOrAfter(series, target);
	if (after != series.end() && after->timestamp == target) {
		++after;
	}
	if (after == series.end()) {
		return std::nullopt;
	}
	const auto before_end = firstAtOrAfter(series, target);
	if (before_end == series.begin()) {
		return std::nullopt;
	}
	const auto &left = *(before_end - 1);
	const auto &right = *after;

	using Seconds = std::chrono::duration<double>;
	const double span = Seconds(right.timestamp - left.timestamp).count();
	const double offset = Seconds(target - left.timestamp).count();
	const double weight = offset / span;
	return BaselineEstimate{left.value + weight * (right.value - left.value), left.timestamp, right.timestamp};
}

std::optional<BaselineEstimate> forwardFill(const core::HourlySeries &series, core::TimePoint target) {
	auto at = firstAtOrAfter(series, target);
	if (at != series.begin()) {
		const auto &prev = *(at - 1);
		return BaselineEstimate{prev.value, prev.timestamp, prev.timestamp};
	}
	if (at != series.end() && at->timestamp == target) {
		++at;
	}
	if (at == series.end()) {
		return std::nullopt;
	}
	return BaselineEstimate{at->value, at->timestamp, at->timestamp};
}

} // namespace gapfill::imputation
