#pragma once

#include "gapfill/store/reading_store.hpp"
#include "gapfill/store/sqlite_database.hpp"

#include <memory>

namespace gapfill::store {

/**
 * @class SqliteReadingStore
 * @brief ReadingStore over a narrow (station, ts, parameter) table.
 */
class SqliteReadingStore final : public ReadingStore {
public:
	explicit SqliteReadingStore(std::shared_ptr<Database> db);

	std::vector<core::Reading> getReadings(const std::string &station_id, core::TimePoint start,
	                                       core::TimePoint end) const override;
	void upsertReading(const core::ReadingUpsert &upsert) override;
	bool stationExists(const std::string &station_id) const override;
	std::vector<std::string> listStations() const override;
	std::optional<TimeRange> timeBounds(const std::string &station_id) const override;

	/// Registers a station; a no-op when it already exists.
	void addStation(const std::string &station_id, const std::string &name = {});

private:
	std::shared_ptr<Database> db_;
};

} // namespace gapfill::store
