#pragma once

#include "gapfill/core/series.hpp"

#include <optional>

namespace gapfill::imputation {

/// A baseline estimate and the observed points it was derived from.
struct BaselineEstimate {
	double value = 0.0;
	core::TimePoint source_start{};
	core::TimePoint source_end{};
};

/**
 * @brief Time-weighted linear interpolation between the nearest points strictly before and after @p target.
 *
 * Absent when either side has no point. For a single missing hour this is the midpoint.
 */
std::optional<BaselineEstimate> linearInterpolate(const core::HourlySeries &series, core::TimePoint target);

/// Last value strictly before @p target; the next value after it when nothing precedes.
std::optional<BaselineEstimate> forwardFill(const core::HourlySeries &series, core::TimePoint target);

} // namespace gapfill::imputation
