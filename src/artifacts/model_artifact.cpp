#include "gapfill/artifacts/model_artifact.hpp"

#include <stdexcept>

namespace gapfill::artifacts {

std::string ModelKey::toString() const {
	return station_id + "/" + core::parameterName(parameter);
}

std::string certificationName(Certification certification) {
	switch (certification) {
	case Certification::Pending:
		return "pending";
	case Certification::Certified:
		return "certified";
	case Certification::Rejected:
		return "rejected";
	}
	return "pending";
}

Certification parseCertification(const std::string &name) {
	if (name == "pending") {
		return Certification::Pending;
	}
	if (name == "certified") {
		return Certification::Certified;
	}
	if (name == "rejected") {
		return Certification::Rejected;
	}
	throw std::invalid_argument("Unknown certification state: " + name);
}

std::string versionTag(std::uint32_t version) {
	return "v" + std::to_string(version);
}

} // namespace gapfill::artifacts
