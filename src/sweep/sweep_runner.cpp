#include "gapfill/sweep/sweep_runner.hpp"

#include "gapfill/engine.hpp"
#include "gapfill/utils/logging.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

namespace gapfill::sweep {

std::string stationStatusName(StationStatus status) {
	switch (status) {
	case StationStatus::Succeeded:
		return "succeeded";
	case StationStatus::Failed:
		return "failed";
	case StationStatus::Skipped:
		return "skipped";
	case StationStatus::Cancelled:
		return "cancelled";
	}
	return "cancelled";
}

SweepRunner::SweepRunner(std::shared_ptr<Engine> engine, core::SweepConfig config)
    : engine_(std::move(engine)), config_(config) {
	if (!engine_) {
		throw std::invalid_argument("SweepRunner requires an engine.");
	}
	config_.validate();
}

SweepSummary SweepRunner::fillGaps(std::vector<std::string> stations, core::TimePoint start, core::TimePoint end,
                                   core::Parameter parameter, const CancellationToken *token) {
	if (end < start) {
		throw std::invalid_argument("Sweep range must not end before it starts.");
	}
	return run("gap-fill", std::move(stations), token, [&](const std::string &station) {
		StationResult result;
		result.station_id = station;
		std::size_t filled = 0;
		std::size_t unfilled = 0;
		for (const auto &outcome : engine_->fillGaps(station, start, end, parameter)) {
			if (outcome.status == imputation::ImputationStatus::Imputed) {
				++filled;
			} else if (!outcome.filled()) {
				++unfilled;
			}
		}
		result.status = filled == 0 ? StationStatus::Skipped : StationStatus::Succeeded;
		result.message = std::to_string(filled) + " filled, " + std::to_string(unfilled) + " left missing";
		return result;
	});
}

SweepSummary SweepRunner::trainAll(std::vector<std::string> stations, core::Parameter parameter,
                                   const CancellationToken *token) {
	return run("training", std::move(stations), token, [&](const std::string &station) {
		const auto outcome = engine_->train(station, parameter);
		StationResult result;
		result.station_id = station;
		result.message = outcome.message;
		switch (outcome.status) {
		case training::TrainingStatus::Completed:
			result.status = StationStatus::Succeeded;
			break;
		case training::TrainingStatus::InsufficientHistory:
			result.status = StationStatus::Skipped;
			break;
		case training::TrainingStatus::TrainingFailed:
			result.status = StationStatus::Failed;
			break;
		}
		return result;
	});
}

SweepSummary SweepRunner::validateAll(std::vector<std::string> stations, core::Parameter parameter,
                                      const CancellationToken *token) {
	return run("validation", std::move(stations), token, [&](const std::string &station) {
		const auto outcome = engine_->validate(station, parameter);
		StationResult result;
		result.station_id = station;
		result.message = outcome.reason;
		result.status = outcome.status == validation::ValidationStatus::Completed ? StationStatus::Succeeded
		                                                                          : StationStatus::Skipped;
		return result;
	});
}

SweepSummary SweepRunner::run(const char *what, std::vector<std::string> stations, const CancellationToken *token,
                              const StationTask &task) {
	if (stations.empty()) {
		stations = engine_->readings()->listStations();
	}

	SweepSummary summary;
	summary.stations.resize(stations.size());
	for (std::size_t i = 0; i < stations.size(); ++i) {
		summary.stations[i].station_id = stations[i];
	}

	std::atomic<std::size_t> next{0};
	const auto worker = [&]() {
		for (std::size_t i = next++; i < stations.size(); i = next++) {
			auto &slot = summary.stations[i];
			if (token && token->cancelled()) {
				slot.status = StationStatus::Cancelled;
				continue;
			}
			try {
				slot = task(stations[i]);
			} catch (const std::exception &e) {
				slot.station_id = stations[i];
				slot.status = StationStatus::Failed;
				slot.message = e.what();
				GAPFILL_ERROR("{} of station {} failed: {}", what, stations[i], e.what());
			}
		}
	};

	const std::size_t workers = std::min(config_.workers, stations.size());
	std::vector<std::future<void>> futures;
	for (std::size_t w = 1; w < workers; ++w) {
		futures.push_back(std::async(std::launch::async, worker));
	}
	if (!stations.empty()) {
		worker();
	}
	for (auto &f : futures) {
		f.get();
	}

	for (const auto &result : summary.stations) {
		switch (result.status) {
		case StationStatus::Succeeded:
			++summary.succeeded;
			break;
		case StationStatus::Failed:
			++summary.failed;
			break;
		case StationStatus::Skipped:
			++summary.skipped;
			break;
		case StationStatus::Cancelled:
			++summary.cancelled;
			break;
		}
	}
	GAPFILL_INFO("{} sweep over {} station(s): {} succeeded, {} failed, {} skipped, {} cancelled.", what,
	             summary.total(), summary.succeeded, summary.failed, summary.skipped, summary.cancelled);
	return summary;
}

} // namespace gapfill::sweep
