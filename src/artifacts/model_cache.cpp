#include "gapfill/artifacts/model_cache.hpp"

#include "gapfill/utils/logging.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace gapfill::artifacts {

TtlModelCache::TtlModelCache(std::shared_ptr<const ArtifactRepository> repository, std::chrono::seconds ttl,
                             ClockFn clock)
    : repository_(std::move(repository)), ttl_(ttl), clock_(std::move(clock)) {
	if (!repository_) {
		throw std::invalid_argument("TtlModelCache requires an artifact repository.");
	}
	if (ttl_.count() < 0) {
		throw std::invalid_argument("Model cache TTL must be non-negative.");
	}
	if (!clock_) {
		throw std::invalid_argument("TtlModelCache requires a clock.");
	}
}

std::shared_ptr<const ModelArtifact> TtlModelCache::get(const ModelKey &key) {
	const auto now = clock_();
	std::uint64_t generation = 0;
	{
		std::shared_lock<std::shared_mutex> lock(mutex_);
		const auto it = entries_.find(key);
		if (it != entries_.end() && now - it->second.loaded_at < ttl_) {
			return it->second.artifact;
		}
		generation = generationOf(key);
	}

	// Loaded without holding the lock so other keys stay readable.
	auto loaded = repository_->active(key);

	std::unique_lock<std::shared_mutex> lock(mutex_);
	++loads_;
	if (!loaded) {
		entries_.erase(key);
		return nullptr;
	}
	auto artifact = std::make_shared<const ModelArtifact>(std::move(*loaded));
	if (generationOf(key) != generation) {
		// Invalidated while loading: the snapshot may predate a publish or a certification change.
		GAPFILL_DEBUG("Model cache skipped storing {} {} invalidated during load.", key.toString(),
		              artifact->versionTag());
		return artifact;
	}
	entries_[key] = Entry{artifact, now};
	GAPFILL_DEBUG("Model cache loaded {} {}.", key.toString(), artifact->versionTag());
	return artifact;
}

void TtlModelCache::invalidate(const ModelKey &key) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	entries_.erase(key);
	++generations_[key];
}

void TtlModelCache::clear() {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	entries_.clear();
	++clear_generation_;
}

std::uint64_t TtlModelCache::generationOf(const ModelKey &key) const {
	const auto it = generations_.find(key);
	return clear_generation_ + (it == generations_.end() ? 0 : it->second);
}

std::size_t TtlModelCache::size() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return entries_.size();
}

std::size_t TtlModelCache::loads() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return loads_;
}

} // namespace gapfill::artifacts
