#pragma once

#include "gapfill/core/series.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace gapfill::training {

/**
 * @struct WindowSet
 * @brief Supervised samples: each row of @c inputs is N consecutive values, @c targets the value one hour later.
 */
struct WindowSet {
	Eigen::MatrixXd inputs;
	Eigen::VectorXd targets;
	std::vector<core::TimePoint> target_times;

	std::size_t size() const {
		return static_cast<std::size_t>(targets.size());
	}

	/// Rows [first, first + count).
	WindowSet slice(std::size_t first, std::size_t count) const;
	/// Rows selected by @p rows, in that order.
	WindowSet select(const std::vector<std::size_t> &rows) const;
};

/**
 * @brief Sliding windows over each run; runs shorter than window_size + 1 contribute nothing.
 *
 * Windows never cross run boundaries. The result is ordered by target time.
 */
WindowSet buildWindows(const std::vector<core::HourlySeries> &runs, std::size_t window_size);

/**
 * @struct ChronologicalSplit
 * @brief Earlier windows for fitting, later windows for early stopping.
 */
struct ChronologicalSplit {
	WindowSet training;
	WindowSet validation;
};

/**
 * @brief Splits ordered windows so that the last @p validation_fraction go to validation.
 *
 * Both parts keep at least one window.
 * @throws std::invalid_argument with fewer than two windows or a fraction outside (0, 1).
 */
ChronologicalSplit splitChronologically(const WindowSet &windows, double validation_fraction);

} // namespace gapfill::training
