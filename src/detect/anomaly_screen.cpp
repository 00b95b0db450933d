#include "gapfill/detect/anomaly_screen.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace gapfill::detect {

std::string anomalyKindName(AnomalyKind kind) {
	switch (kind) {
	case AnomalyKind::Spike:
		return "spike";
	case AnomalyKind::Negative:
		return "negative";
	case AnomalyKind::Rate:
		return "rate";
	case AnomalyKind::Stuck:
		return "stuck";
	}
	return "spike";
}

AnomalyScreen::AnomalyScreen(core::AnomalyConfig config) : config_(config) {
	config_.validate();
}

std::vector<AnomalyFlag> AnomalyScreen::screen(const core::HourlySeries &series) const {
	std::vector<AnomalyFlag> flags;

	for (std::size_t i = 0; i < series.size(); ++i) {
		const auto &point = series[i];
		if (point.value < 0.0) {
			flags.push_back({point.timestamp, point.value, AnomalyKind::Negative, 0.0});
		}
		if (i == 0) {
			continue;
		}

		const auto &prev = series[i - 1];
		const double base = std::max(prev.value, config_.spike_min_base);
		if (point.value >= base * config_.spike_factor) {
			flags.push_back({point.timestamp, point.value, AnomalyKind::Spike, prev.value});
		}

		const double hours =
		    std::chrono::duration<double, std::ratio<3600>>(point.timestamp - prev.timestamp).count();
		if (hours > 0.0 && std::abs(point.value - prev.value) / hours > config_.max_rate_per_hour) {
			flags.push_back({point.timestamp, point.value, AnomalyKind::Rate, prev.value});
		}
	}

	// Runs of identical values over consecutive hours.
	std::size_t run_start = 0;
	for (std::size_t i = 1; i <= series.size(); ++i) {
		const bool continues = i < series.size() && series[i].value == series[run_start].value &&
		                       series[i].timestamp - series[i - 1].timestamp == core::kOneHour;
		if (continues) {
			continue;
		}
		if (i - run_start >= config_.stuck_run_hours) {
			for (std::size_t k = run_start; k < i; ++k) {
				flags.push_back({series[k].timestamp, series[k].value, AnomalyKind::Stuck, 0.0});
			}
		}
		run_start = i;
	}

	std::stable_sort(flags.begin(), flags.end(), [](const AnomalyFlag &a, const AnomalyFlag &b) {
		if (a.timestamp != b.timestamp) {
			return a.timestamp < b.timestamp;
		}
		return static_cast<int>(a.kind) < static_cast<int>(b.kind);
	});
	return flags;
}

} // namespace gapfill::detect
