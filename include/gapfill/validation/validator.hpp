#pragma once

#include "gapfill/artifacts/artifact_repository.hpp"
#include "gapfill/artifacts/model_cache.hpp"
#include "gapfill/audit/audit_log.hpp"
#include "gapfill/core/config.hpp"
#include "gapfill/core/series.hpp"
#include "gapfill/store/reading_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace gapfill::validation {

enum class ValidationStatus {
	Completed,        // a verdict was reached
	ModelUnavailable, // no trained model to validate
	InsufficientData  // no held-out point had both a context window and baselines
};

std::string validationStatusName(ValidationStatus status);

struct ValidationOutcome {
	ValidationStatus status = ValidationStatus::ModelUnavailable;
	artifacts::ModelKey key;
	std::optional<std::uint32_t> model_version;
	std::size_t candidate_points = 0; // held-out points drawn
	std::size_t test_samples = 0;     // held-out points actually scored
	utils::AccuracyMetrics model;
	utils::AccuracyMetrics linear;
	utils::AccuracyMetrics forward_fill;
	double improvement_over_linear = 0.0;       // percent RMSE reduction
	double improvement_over_forward_fill = 0.0;
	bool certified = false;
	std::string reason;
};

/**
 * @brief Scores @p artifact on a seeded random hold-out of @p known_good against both baselines.
 *
 * Each held-out point needs its own context window from @p known_good; the
 * baselines never see held-out values. The verdict is certified when the model
 * beats linear interpolation on RMSE and its R² exceeds @c min_r2.
 */
ValidationOutcome evaluateModel(const artifacts::ModelArtifact &artifact, const core::HourlySeries &known_good,
                                const core::ValidatorConfig &config);

/**
 * @class Validator
 * @brief Certifies or rejects the active model of a key and records the verdict.
 */
class Validator {
public:
	Validator(std::shared_ptr<const store::ReadingStore> store, std::shared_ptr<artifacts::ArtifactRepository> repository,
	          std::shared_ptr<artifacts::ModelCache> cache, std::shared_ptr<audit::AuditLog> audit,
	          core::ValidatorConfig config);

	/**
	 * @throws std::invalid_argument for an unknown station.
	 * @throws core::StoreUnavailable when readings, artifacts or the log cannot be accessed.
	 */
	ValidationOutcome validate(const artifacts::ModelKey &key);

private:
	std::shared_ptr<const store::ReadingStore> store_;
	std::shared_ptr<artifacts::ArtifactRepository> repository_;
	std::shared_ptr<artifacts::ModelCache> cache_;
	std::shared_ptr<audit::AuditLog> audit_;
	core::ValidatorConfig config_;
};

} // namespace gapfill::validation
