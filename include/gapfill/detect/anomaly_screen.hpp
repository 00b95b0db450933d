#pragma once

#include "gapfill/core/config.hpp"
#include "gapfill/core/series.hpp"

#include <string>
#include <vector>

namespace gapfill::detect {

enum class AnomalyKind {
	Spike,    // at least spike_factor times the previous value
	Negative,
	Rate,     // change per hour above max_rate_per_hour
	Stuck     // part of a run of identical hourly values
};

std::string anomalyKindName(AnomalyKind kind);

struct AnomalyFlag {
	core::TimePoint timestamp{};
	double value = 0.0;
	AnomalyKind kind = AnomalyKind::Spike;
	double previous_value = 0.0; // spike and rate flags only
};

/**
 * @class AnomalyScreen
 * @brief Rule-based screening of an hourly series.
 *
 * A value may carry several flags. Flags are ordered by timestamp, then kind.
 */
class AnomalyScreen {
public:
	explicit AnomalyScreen(core::AnomalyConfig config = {});

	std::vector<AnomalyFlag> screen(const core::HourlySeries &series) const;

	bool hasAnomaly(const core::HourlySeries &series) const {
		return !screen(series).empty();
	}

	const core::AnomalyConfig &config() const noexcept {
		return config_;
	}

private:
	core::AnomalyConfig config_;
};

} // namespace gapfill::detect
