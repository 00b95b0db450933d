#include "gapfill/core/parameter.hpp"

#include <algorithm>
#include <stdexcept>

namespace gapfill::core {

namespace {

const std::array<ParameterSpec, kParameterCount> kSpecs = {{
    {Parameter::PM25, "pm25", "ug/m3", 0.0, 1000.0},
    {Parameter::PM10, "pm10", "ug/m3", 0.0, 2000.0},
    {Parameter::O3, "o3", "ppb", 0.0, 1000.0},
    {Parameter::CO, "co", "ppm", 0.0, 100.0},
    {Parameter::NO2, "no2", "ppb", 0.0, 2000.0},
    {Parameter::SO2, "so2", "ppb", 0.0, 2000.0},
    {Parameter::NOX, "nox", "ppb", 0.0, 4000.0},
    {Parameter::WindSpeed, "ws", "m/s", 0.0, 100.0},
    {Parameter::WindDirection, "wd", "deg", 0.0, 360.0},
    {Parameter::Temperature, "temp", "degC", -60.0, 60.0},
    {Parameter::RelativeHumidity, "rh", "%", 0.0, 100.0},
    {Parameter::Pressure, "bp", "mmHg", 500.0, 850.0},
    {Parameter::Rain, "rain", "mm", 0.0, 500.0},
}};

const std::array<Parameter, kParameterCount> kParameters = {
    Parameter::PM25, Parameter::PM10, Parameter::O3, Parameter::CO, Parameter::NO2,
    Parameter::SO2, Parameter::NOX, Parameter::WindSpeed, Parameter::WindDirection,
    Parameter::Temperature, Parameter::RelativeHumidity, Parameter::Pressure, Parameter::Rain};

} // namespace

double ParameterSpec::clamp(double value) const {
	return std::max(min_valid, std::min(max_valid, value));
}

const ParameterSpec &parameterSpec(Parameter parameter) {
	return kSpecs[static_cast<std::size_t>(parameter)];
}

const std::array<Parameter, kParameterCount> &allParameters() {
	return kParameters;
}

std::string parameterName(Parameter parameter) {
	return parameterSpec(parameter).name;
}

Parameter parseParameter(const std::string &name) {
	for (const auto &spec : kSpecs) {
		if (name == spec.name) {
			return spec.parameter;
		}
	}
	throw std::invalid_argument("Unknown parameter '" + name + "'.");
}

} // namespace gapfill::core
