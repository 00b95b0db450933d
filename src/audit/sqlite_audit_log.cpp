#include "gapfill/audit/sqlite_audit_log.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace gapfill::audit {

using core::fromEpochSeconds;
using core::toEpochSeconds;

namespace {

// SQLite stores NaN as NULL; keep that explicit.
std::optional<double> finiteOrNull(double value) {
	if (std::isfinite(value)) {
		return value;
	}
	return std::nullopt;
}

double nanIfNull(const store::Statement &stmt, int column) {
	return stmt.columnOptionalDouble(column).value_or(std::numeric_limits<double>::quiet_NaN());
}

void bindMetrics(store::Statement &stmt, int first, const utils::AccuracyMetrics &metrics) {
	stmt.bindOptionalDouble(first, finiteOrNull(metrics.rmse))
	    .bindOptionalDouble(first + 1, finiteOrNull(metrics.mae))
	    .bindOptionalDouble(first + 2, metrics.r_squared)
	    .bindInt64(first + 3, static_cast<std::int64_t>(metrics.n));
}

utils::AccuracyMetrics readMetrics(const store::Statement &stmt, int first) {
	utils::AccuracyMetrics metrics;
	metrics.rmse = nanIfNull(stmt, first);
	metrics.mae = nanIfNull(stmt, first + 1);
	metrics.mse = std::isfinite(metrics.rmse) ? metrics.rmse * metrics.rmse : metrics.rmse;
	metrics.r_squared = stmt.columnOptionalDouble(first + 2);
	metrics.n = static_cast<std::size_t>(stmt.columnInt64(first + 3));
	return metrics;
}

constexpr const char *kImputationColumns =
    "id, station_id, ts, parameter, imputed_value, raw_value, clamped, method, window_start, window_end, "
    "model_version, error_bound, created_at, superseded_at, superseded_reason";

ImputationLogEntry readImputation(const store::Statement &stmt) {
	ImputationLogEntry entry;
	entry.id = stmt.columnInt64(0);
	entry.station_id = stmt.columnText(1);
	entry.timestamp = fromEpochSeconds(stmt.columnInt64(2));
	entry.parameter = core::parseParameter(stmt.columnText(3));
	entry.imputed_value = stmt.columnDouble(4);
	entry.raw_value = stmt.columnDouble(5);
	entry.clamped = stmt.columnInt64(6) != 0;
	entry.method = stmt.columnText(7);
	entry.window_start = fromEpochSeconds(stmt.columnInt64(8));
	entry.window_end = fromEpochSeconds(stmt.columnInt64(9));
	entry.model_version = stmt.columnOptionalText(10);
	entry.error_bound = stmt.columnOptionalDouble(11);
	entry.created_at = fromEpochSeconds(stmt.columnInt64(12));
	if (!stmt.isNull(13)) {
		entry.superseded_at = fromEpochSeconds(stmt.columnInt64(13));
	}
	entry.superseded_reason = stmt.columnOptionalText(14);
	return entry;
}

} // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<store::Database> db) : db_(std::move(db)) {
	if (!db_) {
		throw std::invalid_argument("SqliteAuditLog requires a database.");
	}
	db_->execute("CREATE TABLE IF NOT EXISTS training_log ("
	             "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
	             "  station_id TEXT NOT NULL,"
	             "  parameter TEXT NOT NULL,"
	             "  model_version INTEGER,"
	             "  status TEXT NOT NULL,"
	             "  training_samples INTEGER NOT NULL,"
	             "  validation_samples INTEGER NOT NULL,"
	             "  contiguous_runs INTEGER NOT NULL,"
	             "  train_rmse REAL, train_mae REAL, train_r2 REAL, train_n INTEGER NOT NULL,"
	             "  val_rmse REAL, val_mae REAL, val_r2 REAL, val_n INTEGER NOT NULL,"
	             "  epochs_completed INTEGER NOT NULL,"
	             "  duration_seconds REAL NOT NULL,"
	             "  message TEXT,"
	             "  created_at INTEGER NOT NULL"
	             ");"
	             "CREATE TABLE IF NOT EXISTS imputation_log ("
	             "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
	             "  station_id TEXT NOT NULL,"
	             "  ts INTEGER NOT NULL,"
	             "  parameter TEXT NOT NULL,"
	             "  imputed_value REAL NOT NULL,"
	             "  raw_value REAL NOT NULL,"
	             "  clamped INTEGER NOT NULL,"
	             "  method TEXT NOT NULL,"
	             "  window_start INTEGER NOT NULL,"
	             "  window_end INTEGER NOT NULL,"
	             "  model_version TEXT,"
	             "  error_bound REAL,"
	             "  created_at INTEGER NOT NULL,"
	             "  superseded_at INTEGER,"
	             "  superseded_reason TEXT"
	             ");"
	             "CREATE INDEX IF NOT EXISTS imputation_log_key ON imputation_log (station_id, parameter, ts);"
	             "CREATE TABLE IF NOT EXISTS validation_log ("
	             "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
	             "  station_id TEXT NOT NULL,"
	             "  parameter TEXT NOT NULL,"
	             "  model_version INTEGER NOT NULL,"
	             "  candidate_points INTEGER NOT NULL,"
	             "  test_samples INTEGER NOT NULL,"
	             "  model_rmse REAL, model_mae REAL, model_r2 REAL, model_n INTEGER NOT NULL,"
	             "  linear_rmse REAL, linear_mae REAL, linear_r2 REAL, linear_n INTEGER NOT NULL,"
	             "  ffill_rmse REAL, ffill_mae REAL, ffill_r2 REAL, ffill_n INTEGER NOT NULL,"
	             "  improvement_over_linear REAL,"
	             "  improvement_over_ffill REAL,"
	             "  certified INTEGER NOT NULL,"
	             "  reason TEXT,"
	             "  created_at INTEGER NOT NULL"
	             ");");
}

std::int64_t SqliteAuditLog::appendTraining(const TrainingLogEntry &entry) {
	auto guard = db_->lock();
	auto stmt = db_->prepare("INSERT INTO training_log (station_id, parameter, model_version, status, "
	                         "training_samples, validation_samples, contiguous_runs, "
	                         "train_rmse, train_mae, train_r2, train_n, val_rmse, val_mae, val_r2, val_n, "
	                         "epochs_completed, duration_seconds, message, created_at) "
	                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
	stmt.bindText(1, entry.station_id).bindText(2, core::parameterName(entry.parameter));
	if (entry.model_version) {
		stmt.bindInt64(3, *entry.model_version);
	} else {
		stmt.bindNull(3);
	}
	stmt.bindText(4, entry.status)
	    .bindInt64(5, static_cast<std::int64_t>(entry.training_samples))
	    .bindInt64(6, static_cast<std::int64_t>(entry.validation_samples))
	    .bindInt64(7, static_cast<std::int64_t>(entry.contiguous_runs));
	bindMetrics(stmt, 8, entry.train_metrics);
	bindMetrics(stmt, 12, entry.validation_metrics);
	stmt.bindInt64(16, static_cast<std::int64_t>(entry.epochs_completed))
	    .bindDouble(17, entry.duration_seconds)
	    .bindText(18, entry.message)
	    .bindInt64(19, toEpochSeconds(core::Clock::now()));
	stmt.run();
	return db_->lastInsertRowId();
}

std::int64_t SqliteAuditLog::appendValidation(const ValidationLogEntry &entry) {
	auto guard = db_->lock();
	auto stmt = db_->prepare("INSERT INTO validation_log (station_id, parameter, model_version, candidate_points, "
	                         "test_samples, model_rmse, model_mae, model_r2, model_n, "
	                         "linear_rmse, linear_mae, linear_r2, linear_n, ffill_rmse, ffill_mae, ffill_r2, ffill_n, "
	                         "improvement_over_linear, improvement_over_ffill, certified, reason, created_at) "
	                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
	stmt.bindText(1, entry.station_id)
	    .bindText(2, core::parameterName(entry.parameter))
	    .bindInt64(3, entry.model_version)
	    .bindInt64(4, static_cast<std::int64_t>(entry.candidate_points))
	    .bindInt64(5, static_cast<std::int64_t>(entry.test_samples));
	bindMetrics(stmt, 6, entry.model_metrics);
	bindMetrics(stmt, 10, entry.linear_metrics);
	bindMetrics(stmt, 14, entry.forward_fill_metrics);
	stmt.bindOptionalDouble(18, finiteOrNull(entry.improvement_over_linear))
	    .bindOptionalDouble(19, finiteOrNull(entry.improvement_over_forward_fill))
	    .bindInt64(20, entry.certified ? 1 : 0)
	    .bindText(21, entry.reason)
	    .bindInt64(22, toEpochSeconds(core::Clock::now()));
	stmt.run();
	return db_->lastInsertRowId();
}

std::int64_t SqliteAuditLog::appendImputation(const ImputationLogEntry &entry) {
	auto guard = db_->lock();
	return insertImputation(entry);
}

std::int64_t SqliteAuditLog::replaceImputation(const ImputationLogEntry &entry, const std::string &reason) {
	auto guard = db_->lock();
	store::Transaction tx(*db_);
	markSuperseded(entry.station_id, entry.timestamp, entry.parameter, reason);
	const auto id = insertImputation(entry);
	tx.commit();
	return id;
}

bool SqliteAuditLog::supersedeImputation(const std::string &station_id, core::TimePoint timestamp,
                                         core::Parameter parameter, const std::string &reason) {
	auto guard = db_->lock();
	return markSuperseded(station_id, timestamp, parameter, reason);
}

std::int64_t SqliteAuditLog::insertImputation(const ImputationLogEntry &entry) {
	auto stmt = db_->prepare("INSERT INTO imputation_log (station_id, ts, parameter, imputed_value, raw_value, "
	                         "clamped, method, window_start, window_end, model_version, error_bound, created_at) "
	                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
	stmt.bindText(1, entry.station_id)
	    .bindInt64(2, toEpochSeconds(entry.timestamp))
	    .bindText(3, core::parameterName(entry.parameter))
	    .bindDouble(4, entry.imputed_value)
	    .bindDouble(5, entry.raw_value)
	    .bindInt64(6, entry.clamped ? 1 : 0)
	    .bindText(7, entry.method)
	    .bindInt64(8, toEpochSeconds(entry.window_start))
	    .bindInt64(9, toEpochSeconds(entry.window_end))
	    .bindOptionalText(10, entry.model_version)
	    .bindOptionalDouble(11, entry.error_bound)
	    .bindInt64(12, toEpochSeconds(core::Clock::now()));
	stmt.run();
	return db_->lastInsertRowId();
}

bool SqliteAuditLog::markSuperseded(const std::string &station_id, core::TimePoint timestamp,
                                    core::Parameter parameter, const std::string &reason) {
	auto stmt = db_->prepare("UPDATE imputation_log SET superseded_at = ?, superseded_reason = ? "
	                         "WHERE station_id = ? AND ts = ? AND parameter = ? AND superseded_at IS NULL");
	stmt.bindInt64(1, toEpochSeconds(core::Clock::now()))
	    .bindText(2, reason)
	    .bindText(3, station_id)
	    .bindInt64(4, toEpochSeconds(timestamp))
	    .bindText(5, core::parameterName(parameter));
	stmt.run();
	return db_->changes() > 0;
}

std::optional<ImputationLogEntry> SqliteAuditLog::activeImputation(const std::string &station_id,
                                                                   core::TimePoint timestamp,
                                                                   core::Parameter parameter) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare(std::string("SELECT ") + kImputationColumns +
	                         " FROM imputation_log WHERE station_id = ? AND ts = ? AND parameter = ? "
	                         "AND superseded_at IS NULL ORDER BY id DESC LIMIT 1");
	stmt.bindText(1, station_id).bindInt64(2, toEpochSeconds(timestamp)).bindText(3, core::parameterName(parameter));
	if (!stmt.step()) {
		return std::nullopt;
	}
	return readImputation(stmt);
}

std::vector<ImputationLogEntry> SqliteAuditLog::imputations(const std::string &station_id, core::Parameter parameter,
                                                            core::TimePoint start, core::TimePoint end) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare(std::string("SELECT ") + kImputationColumns +
	                         " FROM imputation_log WHERE station_id = ? AND parameter = ? AND ts >= ? AND ts <= ? "
	                         "ORDER BY ts, id");
	stmt.bindText(1, station_id)
	    .bindText(2, core::parameterName(parameter))
	    .bindInt64(3, toEpochSeconds(start))
	    .bindInt64(4, toEpochSeconds(end));
	std::vector<ImputationLogEntry> entries;
	while (stmt.step()) {
		entries.push_back(readImputation(stmt));
	}
	return entries;
}

std::vector<TrainingLogEntry> SqliteAuditLog::trainingHistory(const std::string &station_id,
                                                              core::Parameter parameter) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT id, model_version, status, training_samples, validation_samples, "
	                         "contiguous_runs, train_rmse, train_mae, train_r2, train_n, "
	                         "val_rmse, val_mae, val_r2, val_n, epochs_completed, duration_seconds, message, "
	                         "created_at FROM training_log WHERE station_id = ? AND parameter = ? ORDER BY id");
	stmt.bindText(1, station_id).bindText(2, core::parameterName(parameter));

	std::vector<TrainingLogEntry> entries;
	while (stmt.step()) {
		TrainingLogEntry entry;
		entry.id = stmt.columnInt64(0);
		entry.station_id = station_id;
		entry.parameter = parameter;
		if (!stmt.isNull(1)) {
			entry.model_version = static_cast<std::uint32_t>(stmt.columnInt64(1));
		}
		entry.status = stmt.columnText(2);
		entry.training_samples = static_cast<std::size_t>(stmt.columnInt64(3));
		entry.validation_samples = static_cast<std::size_t>(stmt.columnInt64(4));
		entry.contiguous_runs = static_cast<std::size_t>(stmt.columnInt64(5));
		entry.train_metrics = readMetrics(stmt, 6);
		entry.validation_metrics = readMetrics(stmt, 10);
		entry.epochs_completed = static_cast<std::size_t>(stmt.columnInt64(14));
		entry.duration_seconds = stmt.columnDouble(15);
		entry.message = stmt.columnOptionalText(16).value_or("");
		entry.created_at = fromEpochSeconds(stmt.columnInt64(17));
		entries.push_back(std::move(entry));
	}
	return entries;
}

std::vector<ValidationLogEntry> SqliteAuditLog::validationHistory(const std::string &station_id,
                                                                  core::Parameter parameter) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT id, model_version, candidate_points, test_samples, "
	                         "model_rmse, model_mae, model_r2, model_n, linear_rmse, linear_mae, linear_r2, linear_n, "
	                         "ffill_rmse, ffill_mae, ffill_r2, ffill_n, improvement_over_linear, "
	                         "improvement_over_ffill, certified, reason, created_at "
	                         "FROM validation_log WHERE station_id = ? AND parameter = ? ORDER BY id");
	stmt.bindText(1, station_id).bindText(2, core::parameterName(parameter));

	std::vector<ValidationLogEntry> entries;
	while (stmt.step()) {
		ValidationLogEntry entry;
		entry.id = stmt.columnInt64(0);
		entry.station_id = station_id;
		entry.parameter = parameter;
		entry.model_version = static_cast<std::uint32_t>(stmt.columnInt64(1));
		entry.candidate_points = static_cast<std::size_t>(stmt.columnInt64(2));
		entry.test_samples = static_cast<std::size_t>(stmt.columnInt64(3));
		entry.model_metrics = readMetrics(stmt, 4);
		entry.linear_metrics = readMetrics(stmt, 8);
		entry.forward_fill_metrics = readMetrics(stmt, 12);
		entry.improvement_over_linear = nanIfNull(stmt, 16);
		entry.improvement_over_forward_fill = nanIfNull(stmt, 17);
		entry.certified = stmt.columnInt64(18) != 0;
		entry.reason = stmt.columnOptionalText(19).value_or("");
		entry.created_at = fromEpochSeconds(stmt.columnInt64(20));
		entries.push_back(std::move(entry));
	}
	return entries;
}

} // namespace gapfill::audit
