#include "gapfill/imputation/predictor.hpp"

#include "gapfill/utils/logging.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace gapfill::imputation {

Prediction predictWith(const artifacts::ModelArtifact &artifact, const detect::ContextWindow &window) {
	if (!artifact.model) {
		throw std::invalid_argument("Artifact has no model.");
	}
	if (window.size() != artifact.windowSize()) {
		throw std::invalid_argument("Context window has " + std::to_string(window.size()) +
		                            " values but the model expects " + std::to_string(artifact.windowSize()) + ".");
	}
	std::vector<double> inputs = window.values();
	artifact.scaler.transform(inputs);
	const double raw = artifact.scaler.inverseValue(artifact.model->predict(inputs));
	if (!std::isfinite(raw)) {
		throw std::runtime_error("Model " + artifact.key.toString() + " " + artifact.versionTag() +
		                         " produced a non-finite prediction.");
	}

	const auto &spec = core::parameterSpec(artifact.key.parameter);
	Prediction prediction;
	prediction.raw_value = raw;
	prediction.value = spec.clamp(raw);
	prediction.clamped = prediction.value != raw;
	prediction.model_version = artifact.version;
	if (std::isfinite(artifact.validation_metrics.rmse)) {
		prediction.error_bound = artifact.validation_metrics.rmse;
	}
	if (prediction.clamped) {
		GAPFILL_WARN("Clamped prediction for {} at {} from {} to {} {}.", artifact.key.toString(),
		             core::formatTimestamp(window.target), raw, prediction.value, spec.unit);
	}
	return prediction;
}

Predictor::Predictor(std::shared_ptr<artifacts::ModelCache> cache, bool require_certification)
    : cache_(std::move(cache)), require_certification_(require_certification) {
	if (!cache_) {
		throw std::invalid_argument("Predictor requires a model cache.");
	}
}

std::shared_ptr<const artifacts::ModelArtifact> Predictor::usableModel(const artifacts::ModelKey &key) const {
	auto artifact = cache_->get(key);
	if (!artifact) {
		return nullptr;
	}
	switch (artifact->certification) {
	case artifacts::Certification::Rejected:
		GAPFILL_DEBUG("Model {} {} was rejected by validation.", key.toString(), artifact->versionTag());
		return nullptr;
	case artifacts::Certification::Pending:
		if (require_certification_) {
			GAPFILL_DEBUG("Model {} {} is not certified yet.", key.toString(), artifact->versionTag());
			return nullptr;
		}
		break;
	case artifacts::Certification::Certified:
		break;
	}
	return artifact;
}

Prediction Predictor::predict(const artifacts::ModelArtifact &artifact, const detect::ContextWindow &window) const {
	++invocations_;
	return predictWith(artifact, window);
}

} // namespace gapfill::imputation
