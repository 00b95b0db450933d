#include "gapfill/detect/context_window.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gapfill::detect {

bool ContextWindow::containsImputed() const {
	return std::any_of(points.begin(), points.end(), [](const core::HourlyValue &p) { return p.is_imputed; });
}

ContextWindowBuilder::ContextWindowBuilder(std::shared_ptr<const store::ReadingStore> store,
                                           core::ContextConfig config, core::AnomalyConfig anomalies)
    : store_(std::move(store)), config_(config), screen_(anomalies) {
	if (!store_) {
		throw std::invalid_argument("ContextWindowBuilder requires a reading store.");
	}
	config_.validate();
}

std::optional<ContextWindow> ContextWindowBuilder::build(const std::string &station_id, core::Parameter parameter,
                                                         core::TimePoint target) const {
	return build(station_id, parameter, target, config_.context_window_size);
}

std::optional<ContextWindow> ContextWindowBuilder::build(const std::string &station_id, core::Parameter parameter,
                                                         core::TimePoint target, std::size_t window_size) const {
	if (!core::isHourAligned(target)) {
		throw std::invalid_argument("Context target must be hour-aligned.");
	}
	if (window_size == 0) {
		throw std::invalid_argument("Context window size must be positive.");
	}
	const auto n = window_size;
	const auto readings = store_->getReadings(station_id, target - core::Hours(static_cast<int>(n)),
	                                          target - core::kOneHour);
	const auto series = core::extractSeries(readings, parameter, config_.allow_imputed_context);
	return fromSeries(series, station_id, parameter, target, n, config_.screen_anomalies ? &screen_ : nullptr);
}

std::optional<ContextWindow> ContextWindowBuilder::fromSeries(const core::HourlySeries &series,
                                                              const std::string &station_id,
                                                              core::Parameter parameter, core::TimePoint target,
                                                              std::size_t window_size, const AnomalyScreen *screen) {
	if (window_size == 0) {
		throw std::invalid_argument("Context window size must be positive.");
	}
	const auto first = target - core::Hours(static_cast<int>(window_size));
	const auto last = target - core::kOneHour;

	const auto lo = std::lower_bound(series.begin(), series.end(), first,
	                                 [](const core::HourlyValue &p, core::TimePoint t) { return p.timestamp < t; });
	const auto hi = std::upper_bound(series.begin(), series.end(), last,
	                                 [](core::TimePoint t, const core::HourlyValue &p) { return t < p.timestamp; });
	if (static_cast<std::size_t>(std::distance(lo, hi)) != window_size) {
		return std::nullopt;
	}

	ContextWindow window;
	window.station_id = station_id;
	window.parameter = parameter;
	window.target = target;
	window.points.assign(lo, hi);

	if (window.points.front().timestamp != first || window.points.back().timestamp != last) {
		return std::nullopt;
	}
	for (std::size_t i = 1; i < window.points.size(); ++i) {
		if (window.points[i].timestamp - window.points[i - 1].timestamp != core::kOneHour) {
			return std::nullopt;
		}
	}
	if (screen && screen->hasAnomaly(window.points)) {
		return std::nullopt;
	}
	return window;
}

} // namespace gapfill::detect
