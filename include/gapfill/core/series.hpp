#pragma once

#include "gapfill/core/parameter.hpp"
#include "gapfill/core/reading.hpp"
#include "gapfill/core/time.hpp"

#include <vector>

namespace gapfill::core {

struct HourlyValue {
	TimePoint timestamp{};
	double value = 0.0;
	bool is_imputed = false;
};

/// Present values of one parameter, ordered by timestamp.
using HourlySeries = std::vector<HourlyValue>;

/**
 * @brief Present, finite values of @p parameter.
 * @param include_imputed When false, values written by imputation are skipped.
 */
HourlySeries extractSeries(const std::vector<Reading> &readings, Parameter parameter, bool include_imputed);

/// Maximal runs in which consecutive timestamps are exactly one hour apart.
std::vector<HourlySeries> contiguousRuns(const HourlySeries &series);

std::vector<double> seriesValues(const HourlySeries &series);

} // namespace gapfill::core
