#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace gapfill::core {

/**
 * @brief Hourly quantities reported by a monitoring station.
 */
enum class Parameter {
	PM25,
	PM10,
	O3,
	CO,
	NO2,
	SO2,
	NOX,
	WindSpeed,
	WindDirection,
	Temperature,
	RelativeHumidity,
	Pressure,
	Rain
};

constexpr std::size_t kParameterCount = 13;

/**
 * @struct ParameterSpec
 * @brief Static description of a parameter: persisted name, unit and physically valid range.
 */
struct ParameterSpec {
	Parameter parameter;
	const char *name;
	const char *unit;
	double min_valid;
	double max_valid;

	bool contains(double value) const {
		return value >= min_valid && value <= max_valid;
	}

	double clamp(double value) const;
};

const ParameterSpec &parameterSpec(Parameter parameter);
const std::array<Parameter, kParameterCount> &allParameters();

/// Lower-case persisted name, e.g. "pm25".
std::string parameterName(Parameter parameter);

/**
 * @brief Resolves a persisted name back to its parameter.
 * @throws std::invalid_argument for unknown names.
 */
Parameter parseParameter(const std::string &name);

} // namespace gapfill::core
