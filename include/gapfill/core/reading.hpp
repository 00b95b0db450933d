#pragma once

#include "gapfill/core/parameter.hpp"
#include "gapfill/core/time.hpp"

#include <map>
#include <optional>
#include <string>

namespace gapfill::core {

/**
 * @struct Measurement
 * @brief State of one parameter within a reading.
 *
 * An absent value is "missing"; the imputed flag and model version describe
 * where a present value came from.
 */
struct Measurement {
	std::optional<double> value;
	bool is_imputed = false;
	std::optional<std::string> model_version;
};

/**
 * @struct Reading
 * @brief All measurements of one station for one hour.
 */
struct Reading {
	std::string station_id;
	TimePoint timestamp{};
	std::map<Parameter, Measurement> measurements;
	TimePoint created_at{};

	/// Value of a parameter, absent when the parameter is missing or null.
	std::optional<double> value(Parameter parameter) const {
		const auto it = measurements.find(parameter);
		if (it == measurements.end()) {
			return std::nullopt;
		}
		return it->second.value;
	}

	bool isImputed(Parameter parameter) const {
		const auto it = measurements.find(parameter);
		return it != measurements.end() && it->second.is_imputed;
	}

	/// True when any parameter of this reading carries an imputed value.
	bool isImputed() const {
		for (const auto &entry : measurements) {
			if (entry.second.is_imputed) {
				return true;
			}
		}
		return false;
	}

	/// A present value that came from the sensor rather than from imputation.
	bool isObserved(Parameter parameter) const {
		return value(parameter).has_value() && !isImputed(parameter);
	}
};

/**
 * @struct ReadingUpsert
 * @brief Write request for one (station, hour).
 *
 * Each listed parameter is overwritten; a nullopt value writes a null. The
 * imputed flag and model version apply to every listed parameter.
 */
struct ReadingUpsert {
	std::string station_id;
	TimePoint timestamp{};
	std::map<Parameter, std::optional<double>> values;
	bool is_imputed = false;
	std::optional<std::string> model_version;
};

} // namespace gapfill::core
