#include "gapfill/store/sqlite_reading_store.hpp"

#include <stdexcept>
#include <utility>

namespace gapfill::store {

using core::fromEpochSeconds;
using core::toEpochSeconds;

SqliteReadingStore::SqliteReadingStore(std::shared_ptr<Database> db) : db_(std::move(db)) {
	if (!db_) {
		throw std::invalid_argument("SqliteReadingStore requires a database.");
	}
	db_->execute("CREATE TABLE IF NOT EXISTS stations ("
	             "  station_id TEXT PRIMARY KEY,"
	             "  name TEXT"
	             ");"
	             "CREATE TABLE IF NOT EXISTS readings ("
	             "  station_id TEXT NOT NULL REFERENCES stations(station_id) ON DELETE CASCADE,"
	             "  ts INTEGER NOT NULL,"
	             "  parameter TEXT NOT NULL,"
	             "  value REAL,"
	             "  is_imputed INTEGER NOT NULL DEFAULT 0,"
	             "  model_version TEXT,"
	             "  created_at INTEGER NOT NULL,"
	             "  PRIMARY KEY (station_id, ts, parameter)"
	             ");");
}

void SqliteReadingStore::addStation(const std::string &station_id, const std::string &name) {
	auto guard = db_->lock();
	auto stmt = db_->prepare("INSERT OR IGNORE INTO stations (station_id, name) VALUES (?, ?)");
	stmt.bindText(1, station_id).bindText(2, name);
	stmt.run();
}

std::vector<core::Reading> SqliteReadingStore::getReadings(const std::string &station_id, core::TimePoint start,
                                                           core::TimePoint end) const {
	std::vector<core::Reading> readings;
	if (end < start) {
		return readings;
	}

	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT ts, parameter, value, is_imputed, model_version, created_at "
	                         "FROM readings WHERE station_id = ? AND ts >= ? AND ts <= ? "
	                         "ORDER BY ts, parameter");
	stmt.bindText(1, station_id).bindInt64(2, toEpochSeconds(start)).bindInt64(3, toEpochSeconds(end));

	while (stmt.step()) {
		const auto ts = fromEpochSeconds(stmt.columnInt64(0));
		const auto created = fromEpochSeconds(stmt.columnInt64(5));
		if (readings.empty() || readings.back().timestamp != ts) {
			core::Reading reading;
			reading.station_id = station_id;
			reading.timestamp = ts;
			reading.created_at = created;
			readings.push_back(std::move(reading));
		}
		auto &reading = readings.back();
		if (created < reading.created_at) {
			reading.created_at = created;
		}

		core::Measurement measurement;
		measurement.value = stmt.columnOptionalDouble(2);
		measurement.is_imputed = stmt.columnInt64(3) != 0;
		measurement.model_version = stmt.columnOptionalText(4);
		reading.measurements[core::parseParameter(stmt.columnText(1))] = std::move(measurement);
	}
	return readings;
}

void SqliteReadingStore::upsertReading(const core::ReadingUpsert &upsert) {
	if (upsert.values.empty()) {
		return;
	}

	auto guard = db_->lock();
	Transaction tx(*db_);

	auto station = db_->prepare("INSERT OR IGNORE INTO stations (station_id, name) VALUES (?, '')");
	station.bindText(1, upsert.station_id);
	station.run();

	auto stmt = db_->prepare("INSERT INTO readings "
	                         "(station_id, ts, parameter, value, is_imputed, model_version, created_at) "
	                         "VALUES (?, ?, ?, ?, ?, ?, ?) "
	                         "ON CONFLICT(station_id, ts, parameter) DO UPDATE SET "
	                         "value = excluded.value, is_imputed = excluded.is_imputed, "
	                         "model_version = excluded.model_version");
	const auto ts = toEpochSeconds(upsert.timestamp);
	const auto now = toEpochSeconds(core::Clock::now());
	for (const auto &entry : upsert.values) {
		stmt.reset();
		stmt.bindText(1, upsert.station_id)
		    .bindInt64(2, ts)
		    .bindText(3, core::parameterName(entry.first))
		    .bindOptionalDouble(4, entry.second)
		    .bindInt64(5, upsert.is_imputed ? 1 : 0)
		    .bindOptionalText(6, upsert.model_version)
		    .bindInt64(7, now);
		stmt.run();
	}
	tx.commit();
}

bool SqliteReadingStore::stationExists(const std::string &station_id) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT 1 FROM stations WHERE station_id = ?");
	stmt.bindText(1, station_id);
	return stmt.step();
}

std::vector<std::string> SqliteReadingStore::listStations() const {
	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT station_id FROM stations ORDER BY station_id");
	std::vector<std::string> stations;
	while (stmt.step()) {
		stations.push_back(stmt.columnText(0));
	}
	return stations;
}

std::optional<TimeRange> SqliteReadingStore::timeBounds(const std::string &station_id) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT MIN(ts), MAX(ts) FROM readings WHERE station_id = ?");
	stmt.bindText(1, station_id);
	if (!stmt.step() || stmt.isNull(0)) {
		return std::nullopt;
	}
	return TimeRange{fromEpochSeconds(stmt.columnInt64(0)), fromEpochSeconds(stmt.columnInt64(1))};
}

} // namespace gapfill::store
