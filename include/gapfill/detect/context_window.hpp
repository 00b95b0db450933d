#pragma once

#include "gapfill/core/config.hpp"
#include "gapfill/core/series.hpp"
#include "gapfill/detect/anomaly_screen.hpp"
#include "gapfill/store/reading_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gapfill::detect {

/**
 * @struct ContextWindow
 * @brief Exactly N values at the N hours immediately preceding the target.
 */
struct ContextWindow {
	std::string station_id;
	core::Parameter parameter = core::Parameter::PM25;
	core::TimePoint target{};
	core::HourlySeries points;

	core::TimePoint start() const {
		return points.front().timestamp;
	}
	core::TimePoint end() const {
		return points.back().timestamp;
	}
	std::size_t size() const {
		return points.size();
	}
	std::vector<double> values() const {
		return core::seriesValues(points);
	}
	bool containsImputed() const;
};

/**
 * @class ContextWindowBuilder
 * @brief Builds model input for one target hour, or nothing.
 *
 * An absent result means "no context": fewer than N values in
 * [target - N h, target - 1 h], or (with screening on) a flagged value.
 * It is never a partial window. Store failures are thrown, not folded into
 * the absent result.
 */
class ContextWindowBuilder {
public:
	ContextWindowBuilder(std::shared_ptr<const store::ReadingStore> store, core::ContextConfig config,
	                     core::AnomalyConfig anomalies = {});

	/**
	 * @throws std::invalid_argument when @p target is not hour-aligned.
	 * @throws core::StoreUnavailable when the store cannot be read.
	 */
	std::optional<ContextWindow> build(const std::string &station_id, core::Parameter parameter,
	                                   core::TimePoint target) const;

	/// As above with an explicit length, e.g. the window a stored model was trained on.
	std::optional<ContextWindow> build(const std::string &station_id, core::Parameter parameter,
	                                   core::TimePoint target, std::size_t window_size) const;

	/**
	 * @brief The same rule over an in-memory series ordered by timestamp.
	 * @param screen Rejects the window when any of its values is flagged; may be null.
	 */
	static std::optional<ContextWindow> fromSeries(const core::HourlySeries &series, const std::string &station_id,
	                                               core::Parameter parameter, core::TimePoint target,
	                                               std::size_t window_size, const AnomalyScreen *screen = nullptr);

	std::size_t windowSize() const noexcept {
		return config_.context_window_size;
	}

private:
	std::shared_ptr<const store::ReadingStore> store_;
	core::ContextConfig config_;
	AnomalyScreen screen_;
};

} // namespace gapfill::detect
