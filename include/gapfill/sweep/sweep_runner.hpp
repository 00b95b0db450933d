#pragma once

#include "gapfill/core/config.hpp"
#include "gapfill/core/parameter.hpp"
#include "gapfill/core/time.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gapfill {
class Engine;
}

namespace gapfill::sweep {

/// Cooperative stop flag, checked before each station is started.
class CancellationToken {
public:
	void cancel() noexcept {
		cancelled_.store(true);
	}
	bool cancelled() const noexcept {
		return cancelled_.load();
	}

private:
	std::atomic<bool> cancelled_{false};
};

enum class StationStatus {
	Succeeded,
	Failed,
	Skipped,  // expected outcome without work done: no history, no model, nothing to fill
	Cancelled // not started because the sweep was cancelled
};

std::string stationStatusName(StationStatus status);

struct StationResult {
	std::string station_id;
	StationStatus status = StationStatus::Cancelled;
	std::string message;
};

struct SweepSummary {
	std::size_t succeeded = 0;
	std::size_t failed = 0;
	std::size_t skipped = 0;
	std::size_t cancelled = 0;
	std::vector<StationResult> stations; // in the order the stations were given

	std::size_t total() const {
		return stations.size();
	}
};

/**
 * @class SweepRunner
 * @brief Runs one engine operation over many stations with a bounded worker pool.
 *
 * A failure at one station is logged and counted; it never stops the sweep.
 * An empty station list means every registered station.
 */
class SweepRunner {
public:
	SweepRunner(std::shared_ptr<Engine> engine, core::SweepConfig config);

	SweepSummary fillGaps(std::vector<std::string> stations, core::TimePoint start, core::TimePoint end,
	                      core::Parameter parameter = core::Parameter::PM25,
	                      const CancellationToken *token = nullptr);

	SweepSummary trainAll(std::vector<std::string> stations, core::Parameter parameter = core::Parameter::PM25,
	                      const CancellationToken *token = nullptr);

	SweepSummary validateAll(std::vector<std::string> stations, core::Parameter parameter = core::Parameter::PM25,
	                         const CancellationToken *token = nullptr);

private:
	using StationTask = std::function<StationResult(const std::string &)>;

	SweepSummary run(const char *what, std::vector<std::string> stations, const CancellationToken *token,
	                 const StationTask &task);

	std::shared_ptr<Engine> engine_;
	core::SweepConfig config_;
};

} // namespace gapfill::sweep
