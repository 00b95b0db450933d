#pragma once

#include "gapfill/artifacts/artifact_repository.hpp"
#include "gapfill/artifacts/model_cache.hpp"
#include "gapfill/audit/audit_log.hpp"
#include "gapfill/core/config.hpp"
#include "gapfill/store/reading_store.hpp"
#include "gapfill/training/station_locks.hpp"
#include "gapfill/training/windowing.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gapfill::training {

enum class TrainingStatus {
	Completed,
	InsufficientHistory, // skipped, nothing persisted
	TrainingFailed       // diverged, the previous version stays active
};

std::string trainingStatusName(TrainingStatus status);

/// The optimizer produced a non-finite or exploding loss.
class TrainingDiverged : public std::runtime_error {
public:
	explicit TrainingDiverged(const std::string &what) : std::runtime_error(what) {
	}
};

struct TrainingReport {
	std::size_t history_hours = 0; // valid, non-imputed values
	std::size_t contiguous_runs = 0;
	std::size_t usable_runs = 0;   // runs of at least window + 1 hours
	std::size_t training_samples = 0;
	std::size_t validation_samples = 0;
	std::size_t epochs_completed = 0;
	utils::AccuracyMetrics train_metrics;
	utils::AccuracyMetrics validation_metrics;
	double duration_seconds = 0.0;
};

struct TrainingOutcome {
	TrainingStatus status = TrainingStatus::InsufficientHistory;
	artifacts::ModelKey key;
	std::optional<std::uint32_t> version;
	TrainingReport report;
	std::string message;

	bool succeeded() const {
		return status == TrainingStatus::Completed;
	}
};

/**
 * @struct FittedModel
 * @brief Result of fitting on prepared windows, before anything is persisted.
 */
struct FittedModel {
	std::unique_ptr<models::LstmRegressor> model;
	transform::MinMaxScaler scaler;
	std::size_t training_samples = 0;
	std::size_t validation_samples = 0;
	std::size_t epochs_completed = 0;
	double best_validation_loss = 0.0; // scaled space
	std::vector<double> validation_loss_history;
	utils::AccuracyMetrics train_metrics;      // original units
	utils::AccuracyMetrics validation_metrics; // original units
};

/**
 * @brief Fits a fresh LSTM and scaler on chronologically ordered windows.
 *
 * The scaler sees the training split only. Early stopping monitors the
 * validation loss and the best weights are restored.
 * @throws std::invalid_argument with fewer than two windows.
 * @throws TrainingDiverged on a non-finite loss or one above the divergence threshold.
 */
FittedModel fitModel(const WindowSet &windows, const core::TrainerConfig &config);

/**
 * @class Trainer
 * @brief Builds, fits and publishes one model per (station, parameter).
 */
class Trainer {
public:
	Trainer(std::shared_ptr<const store::ReadingStore> store, std::shared_ptr<artifacts::ArtifactRepository> repository,
	        std::shared_ptr<audit::AuditLog> audit, std::shared_ptr<artifacts::ModelCache> cache,
	        std::shared_ptr<StationLocks> locks, core::TrainerConfig config, std::size_t window_size);

	/**
	 * @brief Trains on the key's full non-imputed history and publishes a new version on success.
	 *
	 * Every attempt appends a training log row.
	 * @throws std::invalid_argument for an unknown station.
	 * @throws core::StoreUnavailable when readings or artifacts cannot be accessed.
	 */
	TrainingOutcome train(const artifacts::ModelKey &key);

private:
	/// Logs the attempt to the audit trail.
	TrainingOutcome finish(TrainingOutcome outcome);

	std::shared_ptr<const store::ReadingStore> store_;
	std::shared_ptr<artifacts::ArtifactRepository> repository_;
	std::shared_ptr<audit::AuditLog> audit_;
	std::shared_ptr<artifacts::ModelCache> cache_;
	std::shared_ptr<StationLocks> locks_;
	core::TrainerConfig config_;
	std::size_t window_size_;
};

} // namespace gapfill::training
