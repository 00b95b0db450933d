#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gapfill::models {

/**
 * @class SequenceRegressor
 * @brief Maps a fixed-length window of scaled values to a scalar prediction for the next step.
 *
 * Implementations must be safe to call concurrently through a const reference.
 */
class SequenceRegressor {
public:
	virtual ~SequenceRegressor() = default;

	virtual std::size_t windowSize() const = 0;

	/// @throws std::invalid_argument when the window length differs from windowSize().
	virtual double predict(const std::vector<double> &window) const = 0;

	virtual std::string getName() const = 0;
};

} // namespace gapfill::models
