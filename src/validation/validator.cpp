#include "gapfill/validation/validator.hpp"

#include "gapfill/detect/context_window.hpp"
#include "gapfill/imputation/baselines.hpp"
#include "gapfill/imputation/predictor.hpp"
#include "gapfill/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace gapfill::validation {

namespace {

double improvement(double baseline_rmse, double model_rmse) {
	if (!(baseline_rmse > 0.0) || !std::isfinite(model_rmse)) {
		return 0.0;
	}
	return (baseline_rmse - model_rmse) / baseline_rmse * 100.0;
}

} // namespace

std::string validationStatusName(ValidationStatus status) {
	switch (status) {
	case ValidationStatus::Completed:
		return "completed";
	case ValidationStatus::ModelUnavailable:
		return "model_unavailable";
	case ValidationStatus::InsufficientData:
		return "insufficient_data";
	}
	return "insufficient_data";
}

ValidationOutcome evaluateModel(const artifacts::ModelArtifact &artifact, const core::HourlySeries &known_good,
                                const core::ValidatorConfig &config) {
	config.validate();
	ValidationOutcome outcome;
	outcome.key = artifact.key;
	outcome.model_version = artifact.version;

	const std::size_t n = known_good.size();
	const auto draw = static_cast<std::size_t>(std::floor(static_cast<double>(n) * config.validation_sample_fraction));
	if (draw == 0) {
		outcome.status = ValidationStatus::InsufficientData;
		outcome.reason = "no values to hold out";
		return outcome;
	}

	std::vector<std::size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::mt19937 rng(config.seed);
	std::shuffle(order.begin(), order.end(), rng);
	std::vector<std::size_t> held_out(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(draw));
	std::sort(held_out.begin(), held_out.end());
	outcome.candidate_points = draw;

	std::vector<bool> masked(n, false);
	for (const auto index : held_out) {
		masked[index] = true;
	}
	core::HourlySeries visible;
	visible.reserve(n - draw);
	for (std::size_t i = 0; i < n; ++i) {
		if (!masked[i]) {
			visible.push_back(known_good[i]);
		}
	}

	std::vector<double> actual, model, linear, forward;
	for (const auto index : held_out) {
		const auto &point = known_good[index];
		const auto window = detect::ContextWindowBuilder::fromSeries(known_good, artifact.key.station_id,
		                                                             artifact.key.parameter, point.timestamp,
		                                                             artifact.windowSize());
		if (!window) {
			continue;
		}
		const auto interpolated = imputation::linearInterpolate(visible, point.timestamp);
		const auto carried = imputation::forwardFill(visible, point.timestamp);
		if (!interpolated || !carried) {
			continue;
		}
		actual.push_back(point.value);
		model.push_back(imputation::predictWith(artifact, *window).value);
		linear.push_back(interpolated->value);
		forward.push_back(carried->value);
	}

	outcome.test_samples = actual.size();
	if (actual.empty()) {
		outcome.status = ValidationStatus::InsufficientData;
		outcome.reason = "no held-out point had a context window and both baselines";
		return outcome;
	}

	outcome.status = ValidationStatus::Completed;
	outcome.model = utils::AccuracyMetrics::compute(actual, model);
	outcome.linear = utils::AccuracyMetrics::compute(actual, linear);
	outcome.forward_fill = utils::AccuracyMetrics::compute(actual, forward);
	outcome.improvement_over_linear = improvement(outcome.linear.rmse, outcome.model.rmse);
	outcome.improvement_over_forward_fill = improvement(outcome.forward_fill.rmse, outcome.model.rmse);

	const bool beats_linear = outcome.model.rmse < outcome.linear.rmse;
	const bool explains_variance = outcome.model.r2OrZero() > config.min_r2;
	outcome.certified = beats_linear && explains_variance;

	std::ostringstream reason;
	reason << "model RMSE " << outcome.model.rmse << (beats_linear ? " < " : " >= ") << "linear RMSE "
	       << outcome.linear.rmse << ", R2 " << outcome.model.r2OrZero() << (explains_variance ? " > " : " <= ")
	       << config.min_r2;
	outcome.reason = reason.str();
	return outcome;
}

Validator::Validator(std::shared_ptr<const store::ReadingStore> store,
                     std::shared_ptr<artifacts::ArtifactRepository> repository,
                     std::shared_ptr<artifacts::ModelCache> cache, std::shared_ptr<audit::AuditLog> audit,
                     core::ValidatorConfig config)
    : store_(std::move(store)), repository_(std::move(repository)), cache_(std::move(cache)),
      audit_(std::move(audit)), config_(config) {
	if (!store_ || !repository_ || !cache_ || !audit_) {
		throw std::invalid_argument("Validator requires a store, repository, cache and audit log.");
	}
	config_.validate();
}

ValidationOutcome Validator::validate(const artifacts::ModelKey &key) {
	if (!store_->stationExists(key.station_id)) {
		throw std::invalid_argument("Unknown station: " + key.station_id);
	}

	const auto artifact = repository_->active(key);
	if (!artifact) {
		ValidationOutcome outcome;
		outcome.key = key;
		outcome.status = ValidationStatus::ModelUnavailable;
		outcome.reason = "no trained model";
		GAPFILL_WARN("Cannot validate {}: no trained model.", key.toString());
		return outcome;
	}

	std::vector<core::Reading> readings;
	if (const auto bounds = store_->timeBounds(key.station_id)) {
		readings = store_->getReadings(key.station_id, bounds->start, bounds->end);
	}
	const auto known_good = core::extractSeries(readings, key.parameter, false);

	auto outcome = evaluateModel(*artifact, known_good, config_);
	if (outcome.status == ValidationStatus::Completed) {
		repository_->setCertification(key, artifact->version,
		                              outcome.certified ? artifacts::Certification::Certified
		                                                : artifacts::Certification::Rejected);
		cache_->invalidate(key);
		if (outcome.certified) {
			GAPFILL_INFO("Certified {} {}: {}.", key.toString(), artifact->versionTag(), outcome.reason);
		} else {
			GAPFILL_WARN("Rejected {} {}: {}.", key.toString(), artifact->versionTag(), outcome.reason);
		}
	} else {
		GAPFILL_WARN("Validation of {} {} inconclusive: {}.", key.toString(), artifact->versionTag(), outcome.reason);
	}

	audit::ValidationLogEntry entry;
	entry.station_id = key.station_id;
	entry.parameter = key.parameter;
	entry.model_version = artifact->version;
	entry.candidate_points = outcome.candidate_points;
	entry.test_samples = outcome.test_samples;
	entry.model_metrics = outcome.model;
	entry.linear_metrics = outcome.linear;
	entry.forward_fill_metrics = outcome.forward_fill;
	entry.improvement_over_linear = outcome.improvement_over_linear;
	entry.improvement_over_forward_fill = outcome.improvement_over_forward_fill;
	entry.certified = outcome.certified;
	entry.reason = outcome.reason;
	audit_->appendValidation(entry);
	return outcome;
}

} // namespace gapfill::validation
