#include "gapfill/imputation/imputer.hpp"

#include "gapfill/core/errors.hpp"
#include "gapfill/imputation/baselines.hpp"
#include "gapfill/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gapfill::imputation {

namespace {

constexpr const char *kLstmMethod = "lstm";

const char *fallbackMethodName(core::FallbackMethod method) {
	return method == core::FallbackMethod::ForwardFill ? "forward_fill" : "linear";
}

} // namespace

std::string imputationStatusName(ImputationStatus status) {
	switch (status) {
	case ImputationStatus::Imputed:
		return "imputed";
	case ImputationStatus::AlreadyImputed:
		return "already_imputed";
	case ImputationStatus::NotMissing:
		return "not_missing";
	case ImputationStatus::GapTooLong:
		return "gap_too_long";
	case ImputationStatus::NoContext:
		return "no_context";
	case ImputationStatus::ModelUnavailable:
		return "model_unavailable";
	}
	return "model_unavailable";
}

Imputer::Imputer(std::shared_ptr<store::ReadingStore> store, std::shared_ptr<audit::AuditLog> audit,
                 std::shared_ptr<const detect::GapDetector> gaps,
                 std::shared_ptr<const detect::ContextWindowBuilder> contexts,
                 std::shared_ptr<const Predictor> predictor, core::ImputerConfig config,
                 core::ContextConfig context_config)
    : store_(std::move(store)), audit_(std::move(audit)), gaps_(std::move(gaps)), contexts_(std::move(contexts)),
      predictor_(std::move(predictor)), config_(config), context_config_(context_config) {
	if (!store_ || !audit_ || !gaps_ || !contexts_ || !predictor_) {
		throw std::invalid_argument("Imputer requires a store, audit log, gap detector, context builder and predictor.");
	}
}

ImputationOutcome Imputer::impute(const artifacts::ModelKey &key, core::TimePoint timestamp) {
	if (!core::isHourAligned(timestamp)) {
		throw std::invalid_argument("Imputation target must be hour-aligned.");
	}

	ImputationOutcome outcome;
	outcome.key = key;
	outcome.timestamp = timestamp;

	std::optional<Existing> existing;
	for (const auto &reading : store_->getReadings(key.station_id, timestamp, timestamp)) {
		if (reading.timestamp != timestamp) {
			continue;
		}
		if (reading.isObserved(key.parameter)) {
			outcome.status = ImputationStatus::NotMissing;
			outcome.value = reading.value(key.parameter);
			return outcome;
		}
		if (const auto value = reading.value(key.parameter)) {
			const auto &measurement = reading.measurements.at(key.parameter);
			existing = Existing{*value, measurement.model_version};
		}
	}

	// Classified against the sensor record: earlier imputations do not shorten a gap.
	outcome.gap = gaps_->gapAt(key.station_id, key.parameter, timestamp, true);
	if (outcome.gap && !outcome.gap->isFillable()) {
		outcome.status = ImputationStatus::GapTooLong;
		GAPFILL_WARN("Not imputing {} at {}: part of a {}h gap.", key.toString(), core::formatTimestamp(timestamp),
		             outcome.gap->hours());
		return outcome;
	}

	if (const auto artifact = predictor_->usableModel(key)) {
		return imputeWithModel(std::move(outcome), *artifact, existing);
	}
	return imputeWithFallback(std::move(outcome), existing);
}

ImputationOutcome Imputer::imputeWithModel(ImputationOutcome outcome, const artifacts::ModelArtifact &artifact,
                                           const std::optional<Existing> &existing) {
	const auto &key = outcome.key;
	const auto version = artifact.versionTag();
	if (sameActiveImputation(outcome, existing, version, kLstmMethod)) {
		outcome.status = ImputationStatus::AlreadyImputed;
		outcome.value = existing->value;
		outcome.model_version = version;
		outcome.method = kLstmMethod;
		return outcome;
	}

	const auto window = contexts_->build(key.station_id, key.parameter, outcome.timestamp, artifact.windowSize());
	if (!window) {
		outcome.status = ImputationStatus::NoContext;
		GAPFILL_INFO("No context for {} at {}.", key.toString(), core::formatTimestamp(outcome.timestamp));
		return outcome;
	}
	if (artifact.certification == artifacts::Certification::Pending) {
		GAPFILL_WARN("Imputing {} with {} before it has been validated.", key.toString(), version);
	}

	const auto prediction = predictor_->predict(artifact, *window);

	audit::ImputationLogEntry entry;
	entry.station_id = key.station_id;
	entry.timestamp = outcome.timestamp;
	entry.parameter = key.parameter;
	entry.imputed_value = prediction.value;
	entry.raw_value = prediction.raw_value;
	entry.clamped = prediction.clamped;
	entry.method = kLstmMethod;
	entry.window_start = window->start();
	entry.window_end = window->end();
	entry.model_version = version;
	entry.error_bound = prediction.error_bound;
	write(entry);

	outcome.status = ImputationStatus::Imputed;
	outcome.value = prediction.value;
	outcome.model_version = version;
	outcome.method = kLstmMethod;
	outcome.clamped = prediction.clamped;
	GAPFILL_DEBUG("Imputed {} at {} = {} ({}).", key.toString(), core::formatTimestamp(outcome.timestamp),
	              prediction.value, version);
	return outcome;
}

ImputationOutcome Imputer::imputeWithFallback(ImputationOutcome outcome, const std::optional<Existing> &existing) {
	const auto &key = outcome.key;
	if (config_.fallback == core::FallbackMethod::None) {
		outcome.status = ImputationStatus::ModelUnavailable;
		GAPFILL_INFO("No usable model for {}; {} left missing.", key.toString(),
		             core::formatTimestamp(outcome.timestamp));
		return outcome;
	}

	const std::string method = fallbackMethodName(config_.fallback);
	if (sameActiveImputation(outcome, existing, std::nullopt, method)) {
		outcome.status = ImputationStatus::AlreadyImputed;
		outcome.value = existing->value;
		outcome.method = method;
		return outcome;
	}

	// Neighbours beyond a medium gap would mean the target belongs to a long gap.
	const auto reach = core::Hours(gaps_->config().medium_gap_max_h + 1);
	const auto readings = store_->getReadings(key.station_id, outcome.timestamp - reach, outcome.timestamp + reach);
	auto series = core::extractSeries(readings, key.parameter, context_config_.allow_imputed_context);
	series.erase(std::remove_if(series.begin(), series.end(),
	                            [&](const core::HourlyValue &p) { return p.timestamp == outcome.timestamp; }),
	             series.end());

	const auto estimate = config_.fallback == core::FallbackMethod::ForwardFill
	                          ? forwardFill(series, outcome.timestamp)
	                          : linearInterpolate(series, outcome.timestamp);
	if (!estimate) {
		outcome.status = ImputationStatus::NoContext;
		return outcome;
	}

	const auto &spec = core::parameterSpec(key.parameter);
	audit::ImputationLogEntry entry;
	entry.station_id = key.station_id;
	entry.timestamp = outcome.timestamp;
	entry.parameter = key.parameter;
	entry.raw_value = estimate->value;
	entry.imputed_value = spec.clamp(estimate->value);
	entry.clamped = entry.imputed_value != entry.raw_value;
	entry.method = method;
	entry.window_start = estimate->source_start;
	entry.window_end = estimate->source_end;
	write(entry);

	outcome.status = ImputationStatus::Imputed;
	outcome.value = entry.imputed_value;
	outcome.method = method;
	outcome.clamped = entry.clamped;
	GAPFILL_INFO("Imputed {} at {} by {} fallback.", key.toString(), core::formatTimestamp(outcome.timestamp), method);
	return outcome;
}

bool Imputer::sameActiveImputation(const ImputationOutcome &outcome, const std::optional<Existing> &existing,
                                   const std::optional<std::string> &model_version, const std::string &method) const {
	if (!existing || existing->model_version != model_version) {
		return false;
	}
	const auto active = audit_->activeImputation(outcome.key.station_id, outcome.timestamp, outcome.key.parameter);
	return active && active->method == method;
}

void Imputer::write(const audit::ImputationLogEntry &entry) {
	core::ReadingUpsert upsert;
	upsert.station_id = entry.station_id;
	upsert.timestamp = entry.timestamp;
	upsert.values[entry.parameter] = entry.imputed_value;
	upsert.is_imputed = true;
	upsert.model_version = entry.model_version;
	store_->upsertReading(upsert);

	try {
		audit_->replaceImputation(entry, "re-imputed");
	} catch (const core::StoreUnavailable &e) {
		GAPFILL_ERROR("Imputation log write failed for {} at {}: {}; reverting the value.", entry.station_id,
		              core::formatTimestamp(entry.timestamp), e.what());
		core::ReadingUpsert revert;
		revert.station_id = entry.station_id;
		revert.timestamp = entry.timestamp;
		revert.values[entry.parameter] = std::nullopt;
		store_->upsertReading(revert);
		throw;
	}
}

std::vector<ImputationOutcome> Imputer::fillGap(const core::Gap &gap) {
	std::vector<ImputationOutcome> outcomes;
	const artifacts::ModelKey key{gap.station_id, gap.parameter};
	for (auto hour = gap.start; hour <= gap.end; hour += core::kOneHour) {
		if (!gap.isFillable()) {
			ImputationOutcome outcome;
			outcome.status = ImputationStatus::GapTooLong;
			outcome.key = key;
			outcome.timestamp = hour;
			outcome.gap = gap;
			outcomes.push_back(std::move(outcome));
			continue;
		}
		outcomes.push_back(impute(key, hour));
	}
	return outcomes;
}

bool Imputer::rollback(const artifacts::ModelKey &key, core::TimePoint timestamp) {
	bool was_imputed = false;
	for (const auto &reading : store_->getReadings(key.station_id, timestamp, timestamp)) {
		if (reading.timestamp == timestamp && reading.isImputed(key.parameter)) {
			was_imputed = true;
		}
	}

	if (was_imputed) {
		core::ReadingUpsert revert;
		revert.station_id = key.station_id;
		revert.timestamp = timestamp;
		revert.values[key.parameter] = std::nullopt;
		store_->upsertReading(revert);
	}
	const bool superseded = audit_->supersedeImputation(key.station_id, timestamp, key.parameter, "rolled back");
	if (was_imputed || superseded) {
		GAPFILL_INFO("Rolled back imputation of {} at {}.", key.toString(), core::formatTimestamp(timestamp));
	}
	return was_imputed;
}

std::size_t Imputer::rollbackRange(const artifacts::ModelKey &key, core::TimePoint start, core::TimePoint end) {
	if (end < start) {
		throw std::invalid_argument("Rollback range must not end before it starts.");
	}
	std::size_t reverted = 0;
	for (const auto &reading : store_->getReadings(key.station_id, start, end)) {
		if (reading.isImputed(key.parameter) && rollback(key, reading.timestamp)) {
			++reverted;
		}
	}
	return reverted;
}

} // namespace gapfill::imputation
