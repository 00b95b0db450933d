#pragma once

#include "gapfill/artifacts/artifact_repository.hpp"
#include "gapfill/store/sqlite_database.hpp"

#include <memory>

namespace gapfill::artifacts {

/**
 * @class SqliteArtifactRepository
 * @brief Stores the LSTM weights as a blob beside its architecture and scaler range.
 */
class SqliteArtifactRepository final : public ArtifactRepository {
public:
	explicit SqliteArtifactRepository(std::shared_ptr<store::Database> db);

	std::uint32_t publish(const ModelArtifact &artifact) override;
	std::optional<ModelArtifact> active(const ModelKey &key) const override;
	std::optional<ModelArtifact> byVersion(const ModelKey &key, std::uint32_t version) const override;
	std::vector<ArtifactInfo> versions(const ModelKey &key) const override;
	void setCertification(const ModelKey &key, std::uint32_t version, Certification certification) override;
	std::size_t prune(const ModelKey &key, std::size_t keep_latest) override;

private:
	std::optional<ModelArtifact> load(const ModelKey &key, const std::optional<std::uint32_t> &version) const;

	std::shared_ptr<store::Database> db_;
};

} // namespace gapfill::artifacts
