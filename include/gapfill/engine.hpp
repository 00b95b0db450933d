#pragma once

#include "gapfill/artifacts/model_cache.hpp"
#include "gapfill/artifacts/sqlite_artifact_repository.hpp"
#include "gapfill/audit/sqlite_audit_log.hpp"
#include "gapfill/core/config.hpp"
#include "gapfill/detect/context_window.hpp"
#include "gapfill/detect/gap_detector.hpp"
#include "gapfill/imputation/imputer.hpp"
#include "gapfill/store/sqlite_reading_store.hpp"
#include "gapfill/training/station_locks.hpp"
#include "gapfill/training/trainer.hpp"
#include "gapfill/validation/validator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gapfill {

/**
 * @struct ImputationQuality
 * @brief Logged imputations scored against sensor values that arrived later for the same hour.
 */
struct ImputationQuality {
	std::size_t samples = 0;
	double rmse = 0.0;
	double mae = 0.0;
	double mean_error = 0.0; // imputed minus observed
	double error_std = 0.0;
};

/**
 * @class Engine
 * @brief Wires the SQLite-backed store, logs and model repository to the gap-fill components.
 *
 * One Engine owns one database connection. All operations are safe to call from
 * several threads; training of a single (station, parameter) is serialized.
 */
class Engine {
public:
	/**
	 * @brief Opens (or creates) the database at @p path and builds every component from @p config.
	 * @throws std::invalid_argument for an invalid configuration.
	 * @throws core::StoreUnavailable when the database cannot be opened.
	 */
	Engine(const std::string &path, core::EngineConfig config = core::EngineConfig{});

	Engine(std::shared_ptr<store::Database> db, core::EngineConfig config);

	std::vector<core::Gap> detectGaps(const std::string &station_id, core::TimePoint start, core::TimePoint end,
	                                  core::Parameter parameter = core::Parameter::PM25) const;

	training::TrainingOutcome train(const std::string &station_id, core::Parameter parameter = core::Parameter::PM25);

	imputation::ImputationOutcome impute(const std::string &station_id, core::TimePoint timestamp,
	                                     core::Parameter parameter = core::Parameter::PM25);

	/// Imputes every fillable gap of [start, end]; long gaps are reported, never filled.
	std::vector<imputation::ImputationOutcome> fillGaps(const std::string &station_id, core::TimePoint start,
	                                                    core::TimePoint end,
	                                                    core::Parameter parameter = core::Parameter::PM25);

	validation::ValidationOutcome validate(const std::string &station_id,
	                                       core::Parameter parameter = core::Parameter::PM25);

	bool rollbackImputation(const std::string &station_id, core::TimePoint timestamp,
	                        core::Parameter parameter = core::Parameter::PM25);

	std::size_t rollbackRange(const std::string &station_id, core::TimePoint start, core::TimePoint end,
	                          core::Parameter parameter = core::Parameter::PM25);

	ImputationQuality imputationQuality(const std::string &station_id, core::TimePoint start, core::TimePoint end,
	                                    core::Parameter parameter = core::Parameter::PM25) const;

	/// Deletes all but the newest @p keep_latest artifact versions.
	std::size_t prune(const std::string &station_id, std::size_t keep_latest,
	                  core::Parameter parameter = core::Parameter::PM25);

	const core::EngineConfig &config() const noexcept {
		return config_;
	}
	std::shared_ptr<store::SqliteReadingStore> readings() const {
		return store_;
	}
	std::shared_ptr<audit::SqliteAuditLog> audit() const {
		return audit_;
	}
	std::shared_ptr<artifacts::SqliteArtifactRepository> repository() const {
		return repository_;
	}
	std::shared_ptr<artifacts::TtlModelCache> cache() const {
		return cache_;
	}
	std::shared_ptr<const imputation::Predictor> predictor() const {
		return predictor_;
	}

private:
	core::EngineConfig config_;
	std::shared_ptr<store::Database> db_;
	std::shared_ptr<store::SqliteReadingStore> store_;
	std::shared_ptr<audit::SqliteAuditLog> audit_;
	std::shared_ptr<artifacts::SqliteArtifactRepository> repository_;
	std::shared_ptr<artifacts::TtlModelCache> cache_;
	std::shared_ptr<training::StationLocks> locks_;
	std::shared_ptr<detect::GapDetector> gaps_;
	std::shared_ptr<detect::ContextWindowBuilder> contexts_;
	std::shared_ptr<imputation::Predictor> predictor_;
	std::unique_ptr<imputation::Imputer> imputer_;
	std::unique_ptr<training::Trainer> trainer_;
	std::unique_ptr<validation::Validator> validator_;
};

} // namespace gapfill
