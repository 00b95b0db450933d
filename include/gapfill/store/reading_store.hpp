#pragma once

#include "gapfill/core/reading.hpp"
#include "gapfill/core/time.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gapfill::store {

struct TimeRange {
	core::TimePoint start{};
	core::TimePoint end{};
};

/**
 * @class ReadingStore
 * @brief Read/write access to per-station hourly readings, owned by the ingestion side.
 *
 * Implementations are durable and immediately consistent for a station's own
 * subsequent reads. Every method throws core::StoreUnavailable when the
 * backing store cannot be reached.
 */
class ReadingStore {
public:
	virtual ~ReadingStore() = default;

	/**
	 * @brief Readings of @p station_id with start <= timestamp <= end, ordered by timestamp.
	 *
	 * Hours without a row are simply absent from the result.
	 */
	virtual std::vector<core::Reading> getReadings(const std::string &station_id, core::TimePoint start,
	                                               core::TimePoint end) const = 0;

	/**
	 * @brief Inserts or overwrites the listed parameters of one (station, hour); atomic per reading.
	 */
	virtual void upsertReading(const core::ReadingUpsert &upsert) = 0;

	virtual bool stationExists(const std::string &station_id) const = 0;
	virtual std::vector<std::string> listStations() const = 0;

	/// First and last timestamp with any row for the station, absent when it has none.
	virtual std::optional<TimeRange> timeBounds(const std::string &station_id) const = 0;
};

} // namespace gapfill::store
