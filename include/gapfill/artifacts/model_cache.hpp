#pragma once

#include "gapfill/artifacts/artifact_repository.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>

namespace gapfill::artifacts {

/**
 * @class ModelCache
 * @brief Read-mostly cache of active artifacts shared by concurrent predictions.
 */
class ModelCache {
public:
	virtual ~ModelCache() = default;

	/// The active artifact for @p key, loading it on a miss; nullptr when none exists.
	virtual std::shared_ptr<const ModelArtifact> get(const ModelKey &key) = 0;
	virtual void invalidate(const ModelKey &key) = 0;
	virtual void clear() = 0;
	virtual std::size_t size() const = 0;
};

/**
 * @class TtlModelCache
 * @brief Entries expire a fixed time after they were loaded; a zero TTL reloads on every call.
 *
 * Concurrent misses for one key may each load from the repository; the last
 * load wins, and every caller receives a complete artifact. Absent artifacts
 * are not cached. A load that overlaps invalidate() or clear() for its key is
 * returned to its caller but never stored.
 */
class TtlModelCache final : public ModelCache {
public:
	using ClockFn = std::function<core::TimePoint()>;

	TtlModelCache(std::shared_ptr<const ArtifactRepository> repository, std::chrono::seconds ttl,
	              ClockFn clock = [] { return core::Clock::now(); });

	std::shared_ptr<const ModelArtifact> get(const ModelKey &key) override;
	void invalidate(const ModelKey &key) override;
	void clear() override;
	std::size_t size() const override;

	/// Number of repository loads performed, for diagnostics.
	std::size_t loads() const;

private:
	struct Entry {
		std::shared_ptr<const ModelArtifact> artifact;
		core::TimePoint loaded_at{};
	};

	/// Bumped by invalidate() and clear(); caller holds mutex_.
	std::uint64_t generationOf(const ModelKey &key) const;

	std::shared_ptr<const ArtifactRepository> repository_;
	std::chrono::seconds ttl_;
	ClockFn clock_;

	mutable std::shared_mutex mutex_;
	std::map<ModelKey, Entry> entries_;
	std::map<ModelKey, std::uint64_t> generations_;
	std::uint64_t clear_generation_ = 0;
	std::size_t loads_ = 0;
};

} // namespace gapfill::artifacts
