#pragma once

#include "gapfill/core/parameter.hpp"
#include "gapfill/core/time.hpp"
#include "gapfill/utils/metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gapfill::audit {

/**
 * @struct TrainingLogEntry
 * @brief One training attempt. Failed and skipped attempts are logged too, without a version.
 */
struct TrainingLogEntry {
	std::int64_t id = 0;
	std::string station_id;
	core::Parameter parameter = core::Parameter::PM25;
	std::optional<std::uint32_t> model_version;
	std::string status; // "completed", "insufficient_history" or "failed"
	std::size_t training_samples = 0;
	std::size_t validation_samples = 0;
	std::size_t contiguous_runs = 0;
	utils::AccuracyMetrics train_metrics;
	utils::AccuracyMetrics validation_metrics;
	std::size_t epochs_completed = 0;
	double duration_seconds = 0.0;
	std::string message;
	core::TimePoint created_at{};
};

/**
 * @struct ImputationLogEntry
 * @brief Provenance of one imputed value.
 *
 * Entries are never deleted. A rollback or a re-imputation stamps
 * @c superseded_at; at most one entry per (station, hour, parameter) is active.
 */
struct ImputationLogEntry {
	std::int64_t id = 0;
	std::string station_id;
	core::TimePoint timestamp{};
	core::Parameter parameter = core::Parameter::PM25;
	double imputed_value = 0.0;
	double raw_value = 0.0; // before clamping to the parameter's valid range
	bool clamped = false;
	std::string method;     // "lstm", "linear" or "forward_fill"
	core::TimePoint window_start{};
	core::TimePoint window_end{};
	std::optional<std::string> model_version;
	std::optional<double> error_bound;
	core::TimePoint created_at{};
	std::optional<core::TimePoint> superseded_at;
	std::optional<std::string> superseded_reason;

	bool isActive() const {
		return !superseded_at.has_value();
	}
};

/**
 * @struct ValidationLogEntry
 * @brief Outcome of one held-out validation run with the metrics behind the verdict.
 */
struct ValidationLogEntry {
	std::int64_t id = 0;
	std::string station_id;
	core::Parameter parameter = core::Parameter::PM25;
	std::uint32_t model_version = 0;
	std::size_t candidate_points = 0;
	std::size_t test_samples = 0;
	utils::AccuracyMetrics model_metrics;
	utils::AccuracyMetrics linear_metrics;
	utils::AccuracyMetrics forward_fill_metrics;
	double improvement_over_linear = 0.0; // percent
	double improvement_over_forward_fill = 0.0;
	bool certified = false;
	std::string reason;
	core::TimePoint created_at{};
};

/**
 * @class AuditLog
 * @brief Append-only record of training, imputation and validation events.
 *
 * Implementations throw core::StoreUnavailable when the log cannot be written.
 */
class AuditLog {
public:
	virtual ~AuditLog() = default;

	virtual std::int64_t appendTraining(const TrainingLogEntry &entry) = 0;
	virtual std::int64_t appendValidation(const ValidationLogEntry &entry) = 0;
	virtual std::int64_t appendImputation(const ImputationLogEntry &entry) = 0;

	/**
	 * @brief Supersedes the active entry for the entry's (station, hour, parameter), if any,
	 *        and appends @p entry, atomically.
	 */
	virtual std::int64_t replaceImputation(const ImputationLogEntry &entry, const std::string &reason) = 0;

	/**
	 * @brief Marks the active entry superseded.
	 * @return false when there was no active entry.
	 */
	virtual bool supersedeImputation(const std::string &station_id, core::TimePoint timestamp,
	                                 core::Parameter parameter, const std::string &reason) = 0;

	virtual std::optional<ImputationLogEntry> activeImputation(const std::string &station_id,
	                                                           core::TimePoint timestamp,
	                                                           core::Parameter parameter) const = 0;

	/// Entries with start <= timestamp <= end, oldest first, superseded ones included.
	virtual std::vector<ImputationLogEntry> imputations(const std::string &station_id, core::Parameter parameter,
	                                                    core::TimePoint start, core::TimePoint end) const = 0;

	virtual std::vector<TrainingLogEntry> trainingHistory(const std::string &station_id,
	                                                      core::Parameter parameter) const = 0;
	virtual std::vector<ValidationLogEntry> validationHistory(const std::string &station_id,
	                                                          core::Parameter parameter) const = 0;
};

} // namespace gapfill::audit
