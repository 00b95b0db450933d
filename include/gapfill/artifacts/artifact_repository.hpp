#pragma once

#include "gapfill/artifacts/model_artifact.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gapfill::artifacts {

/// Metadata of a stored version, without its weights.
struct ArtifactInfo {
	ModelKey key;
	std::uint32_t version = 0;
	core::TimePoint trained_at{};
	Certification certification = Certification::Pending;
	double validation_rmse = 0.0;
};

/**
 * @class ArtifactRepository
 * @brief Durable, versioned storage of model artifacts keyed by (station, parameter, version).
 *
 * The newest version of a key is its active artifact. Implementations throw
 * core::StoreUnavailable when storage cannot be reached.
 */
class ArtifactRepository {
public:
	virtual ~ArtifactRepository() = default;

	/**
	 * @brief Stores @p artifact under the next version of its key, atomically.
	 * @return The assigned version; @c artifact.version is ignored.
	 */
	virtual std::uint32_t publish(const ModelArtifact &artifact) = 0;

	virtual std::optional<ModelArtifact> active(const ModelKey &key) const = 0;
	virtual std::optional<ModelArtifact> byVersion(const ModelKey &key, std::uint32_t version) const = 0;

	/// All stored versions, oldest first.
	virtual std::vector<ArtifactInfo> versions(const ModelKey &key) const = 0;

	/// @throws std::invalid_argument when the version does not exist.
	virtual void setCertification(const ModelKey &key, std::uint32_t version, Certification certification) = 0;

	/**
	 * @brief Deletes all but the newest @p keep_latest versions.
	 * @return Number of versions removed.
	 * @throws std::invalid_argument when @p keep_latest is zero.
	 */
	virtual std::size_t prune(const ModelKey &key, std::size_t keep_latest) = 0;
};

} // namespace gapfill::artifacts
