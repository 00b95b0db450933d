#include "gapfill/training/station_locks.hpp"

namespace gapfill::training {

std::shared_ptr<std::mutex> StationLocks::mutexFor(const artifacts::ModelKey &key) {
	std::lock_guard<std::mutex> lock(guard_);
	auto &slot = mutexes_[key];
	if (!slot) {
		slot = std::make_shared<std::mutex>();
	}
	return slot;
}

std::unique_lock<std::mutex> StationLocks::acquire(const artifacts::ModelKey &key) {
	// Mutexes are never erased, so the reference outlives the returned lock.
	return std::unique_lock<std::mutex>(*mutexFor(key));
}

std::unique_lock<std::mutex> StationLocks::tryAcquire(const artifacts::ModelKey &key) {
	return std::unique_lock<std::mutex>(*mutexFor(key), std::try_to_lock);
}

} // namespace gapfill::training
