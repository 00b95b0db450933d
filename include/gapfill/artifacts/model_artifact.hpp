#pragma once

#include "gapfill/core/parameter.hpp"
#include "gapfill/core/time.hpp"
#include "gapfill/models/lstm_regressor.hpp"
#include "gapfill/transform/min_max_scaler.hpp"
#include "gapfill/utils/metrics.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace gapfill::artifacts {

/// Models are trained per station and parameter.
struct ModelKey {
	std::string station_id;
	core::Parameter parameter = core::Parameter::PM25;

	bool operator==(const ModelKey &other) const {
		return station_id == other.station_id && parameter == other.parameter;
	}
	bool operator<(const ModelKey &other) const {
		if (station_id != other.station_id) {
			return station_id < other.station_id;
		}
		return parameter < other.parameter;
	}

	std::string toString() const;
};

enum class Certification {
	Pending,   // trained, not validated yet
	Certified,
	Rejected
};

std::string certificationName(Certification certification);
Certification parseCertification(const std::string &name);

/// "v3" for version 3; the form stored in Reading.model_version.
std::string versionTag(std::uint32_t version);

/**
 * @struct ModelArtifact
 * @brief A trained model with the scaler it was trained with.
 *
 * Versions are assigned by the repository on publish and never reused for a key.
 * The model is shared read-only between the cache and concurrent predictions.
 */
struct ModelArtifact {
	ModelKey key;
	std::uint32_t version = 0;
	core::TimePoint trained_at{};
	std::shared_ptr<const models::LstmRegressor> model;
	transform::MinMaxScaler scaler;
	utils::AccuracyMetrics train_metrics;
	utils::AccuracyMetrics validation_metrics;
	Certification certification = Certification::Pending;

	std::size_t windowSize() const {
		return model ? model->windowSize() : 0;
	}

	std::string versionTag() const {
		return artifacts::versionTag(version);
	}
};

} // namespace gapfill::artifacts
