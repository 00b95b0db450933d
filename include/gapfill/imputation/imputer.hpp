#pragma once

#include "gapfill/audit/audit_log.hpp"
#include "gapfill/core/config.hpp"
#include "gapfill/detect/context_window.hpp"
#include "gapfill/detect/gap_detector.hpp"
#include "gapfill/imputation/predictor.hpp"
#include "gapfill/store/reading_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gapfill::imputation {

enum class ImputationStatus {
	Imputed,
	AlreadyImputed,   // same model and method already filled this hour; nothing written
	NotMissing,       // the hour holds an observed value
	GapTooLong,       // part of a long gap, flagged only
	NoContext,
	ModelUnavailable
};

std::string imputationStatusName(ImputationStatus status);

struct ImputationOutcome {
	ImputationStatus status = ImputationStatus::ModelUnavailable;
	artifacts::ModelKey key;
	core::TimePoint timestamp{};
	std::optional<double> value;
	std::optional<std::string> model_version;
	std::string method; // "lstm", "linear" or "forward_fill" when filled
	bool clamped = false;
	std::optional<core::Gap> gap;

	/// The hour holds an imputed value after the call.
	bool filled() const {
		return status == ImputationStatus::Imputed || status == ImputationStatus::AlreadyImputed;
	}
};

/**
 * @class Imputer
 * @brief Fills single missing hours and writes them back with provenance.
 *
 * Every write of an imputed value is paired with exactly one active
 * imputation log entry; a failed log write reverts the value.
 */
class Imputer {
public:
	Imputer(std::shared_ptr<store::ReadingStore> store, std::shared_ptr<audit::AuditLog> audit,
	        std::shared_ptr<const detect::GapDetector> gaps, std::shared_ptr<const detect::ContextWindowBuilder> contexts,
	        std::shared_ptr<const Predictor> predictor, core::ImputerConfig config, core::ContextConfig context_config);

	/**
	 * @throws std::invalid_argument for an unknown station or a timestamp off the hourly grid.
	 * @throws core::StoreUnavailable when the store or log cannot be accessed.
	 */
	ImputationOutcome impute(const artifacts::ModelKey &key, core::TimePoint timestamp);

	/// Imputes every hour of @p gap front to back; long gaps yield one GapTooLong outcome per hour.
	std::vector<ImputationOutcome> fillGap(const core::Gap &gap);

	/**
	 * @brief Reverts an imputed value to missing and supersedes its log entry.
	 * @return false when the hour held no imputed value.
	 */
	bool rollback(const artifacts::ModelKey &key, core::TimePoint timestamp);

	/// Rolls back every imputed hour in [start, end]; returns how many were reverted.
	std::size_t rollbackRange(const artifacts::ModelKey &key, core::TimePoint start, core::TimePoint end);

private:
	struct Existing {
		double value = 0.0;
		std::optional<std::string> model_version;
	};

	ImputationOutcome imputeWithModel(ImputationOutcome outcome, const artifacts::ModelArtifact &artifact,
	                                  const std::optional<Existing> &existing);
	ImputationOutcome imputeWithFallback(ImputationOutcome outcome, const std::optional<Existing> &existing);
	bool sameActiveImputation(const ImputationOutcome &outcome, const std::optional<Existing> &existing,
	                          const std::optional<std::string> &model_version, const std::string &method) const;
	void write(const audit::ImputationLogEntry &entry);

	std::shared_ptr<store::ReadingStore> store_;
	std::shared_ptr<audit::AuditLog> audit_;
	std::shared_ptr<const detect::GapDetector> gaps_;
	std::shared_ptr<const detect::ContextWindowBuilder> contexts_;
	std::shared_ptr<const Predictor> predictor_;
	core::ImputerConfig config_;
	core::ContextConfig context_config_;
};

} // namespace gapfill::imputation
