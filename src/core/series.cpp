#include "gapfill/core/series.hpp"

#include <cmath>

namespace gapfill::core {

HourlySeries extractSeries(const std::vector<Reading> &readings, Parameter parameter, bool include_imputed) {
	HourlySeries series;
	series.reserve(readings.size());
	for (const auto &reading : readings) {
		const auto value = reading.value(parameter);
		if (!value || !std::isfinite(*value)) {
			continue;
		}
		const bool imputed = reading.isImputed(parameter);
		if (imputed && !include_imputed) {
			continue;
		}
		series.push_back(HourlyValue{reading.timestamp, *value, imputed});
	}
	return series;
}

std::vector<HourlySeries> contiguousRuns(const HourlySeries &series) {
	std::vector<HourlySeries> runs;
	for (const auto &point : series) {
		if (runs.empty() || point.timestamp - runs.back().back().timestamp != kOneHour) {
			runs.emplace_back();
		}
		runs.back().push_back(point);
	}
	return runs;
}

std::vector<double> seriesValues(const HourlySeries &series) {
	std::vector<double> values;
	values.reserve(series.size());
	for (const auto &point : series) {
		values.push_back(point.value);
	}
	return values;
}

} // namespace gapfill::core
