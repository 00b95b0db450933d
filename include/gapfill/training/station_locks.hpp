#pragma once

#include "gapfill/artifacts/model_artifact.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace gapfill::training {

/**
 * @class StationLocks
 * @brief One mutex per model key, serializing training of that key only.
 *
 * Predictions never take these locks; they read whichever complete artifact
 * the repository currently holds.
 */
class StationLocks {
public:
	std::unique_lock<std::mutex> acquire(const artifacts::ModelKey &key);

	/// Returns an unlocked lock object when the key is busy.
	std::unique_lock<std::mutex> tryAcquire(const artifacts::ModelKey &key);

private:
	std::shared_ptr<std::mutex> mutexFor(const artifacts::ModelKey &key);

	std::mutex guard_;
	std::map<artifacts::ModelKey, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace gapfill::training
