#include "gapfill/artifacts/sqlite_artifact_repository.hpp"

#include "gapfill/core/errors.hpp"
#include "gapfill/utils/logging.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace gapfill::artifacts {

using core::fromEpochSeconds;
using core::toEpochSeconds;

namespace {

std::optional<double> finiteOrNull(double value) {
	if (std::isfinite(value)) {
		return value;
	}
	return std::nullopt;
}

utils::AccuracyMetrics readMetrics(const store::Statement &stmt, int first) {
	utils::AccuracyMetrics metrics;
	metrics.rmse = stmt.columnOptionalDouble(first).value_or(std::numeric_limits<double>::quiet_NaN());
	metrics.mae = stmt.columnOptionalDouble(first + 1).value_or(std::numeric_limits<double>::quiet_NaN());
	metrics.mse = metrics.rmse * metrics.rmse;
	metrics.r_squared = stmt.columnOptionalDouble(first + 2);
	metrics.n = static_cast<std::size_t>(stmt.columnInt64(first + 3));
	return metrics;
}

} // namespace

SqliteArtifactRepository::SqliteArtifactRepository(std::shared_ptr<store::Database> db) : db_(std::move(db)) {
	if (!db_) {
		throw std::invalid_argument("SqliteArtifactRepository requires a database.");
	}
	db_->execute("CREATE TABLE IF NOT EXISTS model_artifacts ("
	             "  station_id TEXT NOT NULL,"
	             "  parameter TEXT NOT NULL,"
	             "  version INTEGER NOT NULL,"
	             "  trained_at INTEGER NOT NULL,"
	             "  window_size INTEGER NOT NULL,"
	             "  units_1 INTEGER NOT NULL,"
	             "  units_2 INTEGER NOT NULL,"
	             "  dropout REAL NOT NULL,"
	             "  scaler_min REAL NOT NULL,"
	             "  scaler_max REAL NOT NULL,"
	             "  train_rmse REAL, train_mae REAL, train_r2 REAL, train_n INTEGER NOT NULL,"
	             "  val_rmse REAL, val_mae REAL, val_r2 REAL, val_n INTEGER NOT NULL,"
	             "  certification TEXT NOT NULL,"
	             "  weights BLOB NOT NULL,"
	             "  PRIMARY KEY (station_id, parameter, version)"
	             ");");
}

std::uint32_t SqliteArtifactRepository::publish(const ModelArtifact &artifact) {
	if (!artifact.model) {
		throw std::invalid_argument("Cannot publish an artifact without a model.");
	}
	if (!artifact.scaler.isFitted()) {
		throw std::invalid_argument("Cannot publish an artifact with an unfitted scaler.");
	}

	const auto &config = artifact.model->config();
	const Eigen::VectorXd params = artifact.model->parameters();
	const std::vector<double> weights(params.data(), params.data() + params.size());
	const auto parameter = core::parameterName(artifact.key.parameter);

	auto guard = db_->lock();
	store::Transaction tx(*db_);

	auto next = db_->prepare("SELECT COALESCE(MAX(version), 0) + 1 FROM model_artifacts "
	                         "WHERE station_id = ? AND parameter = ?");
	next.bindText(1, artifact.key.station_id).bindText(2, parameter);
	if (!next.step()) {
		throw core::StoreUnavailable("Failed to determine the next model version for " + artifact.key.toString());
	}
	const auto version = static_cast<std::uint32_t>(next.columnInt64(0));

	auto stmt = db_->prepare("INSERT INTO model_artifacts (station_id, parameter, version, trained_at, window_size, "
	                         "units_1, units_2, dropout, scaler_min, scaler_max, "
	                         "train_rmse, train_mae, train_r2, train_n, val_rmse, val_mae, val_r2, val_n, "
	                         "certification, weights) "
	                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
	stmt.bindText(1, artifact.key.station_id)
	    .bindText(2, parameter)
	    .bindInt64(3, version)
	    .bindInt64(4, toEpochSeconds(artifact.trained_at))
	    .bindInt64(5, static_cast<std::int64_t>(config.window_size))
	    .bindInt64(6, static_cast<std::int64_t>(config.units_1))
	    .bindInt64(7, static_cast<std::int64_t>(config.units_2))
	    .bindDouble(8, config.dropout)
	    .bindDouble(9, artifact.scaler.inputMin())
	    .bindDouble(10, artifact.scaler.inputMax())
	    .bindOptionalDouble(11, finiteOrNull(artifact.train_metrics.rmse))
	    .bindOptionalDouble(12, finiteOrNull(artifact.train_metrics.mae))
	    .bindOptionalDouble(13, artifact.train_metrics.r_squared)
	    .bindInt64(14, static_cast<std::int64_t>(artifact.train_metrics.n))
	    .bindOptionalDouble(15, finiteOrNull(artifact.validation_metrics.rmse))
	    .bindOptionalDouble(16, finiteOrNull(artifact.validation_metrics.mae))
	    .bindOptionalDouble(17, artifact.validation_metrics.r_squared)
	    .bindInt64(18, static_cast<std::int64_t>(artifact.validation_metrics.n))
	    .bindText(19, certificationName(Certification::Pending))
	    .bindBlob(20, weights);
	stmt.run();
	tx.commit();

	GAPFILL_INFO("Published model {} {} ({} weights).", artifact.key.toString(), versionTag(version), weights.size());
	return version;
}

std::optional<ModelArtifact> SqliteArtifactRepository::active(const ModelKey &key) const {
	return load(key, std::nullopt);
}

std::optional<ModelArtifact> SqliteArtifactRepository::byVersion(const ModelKey &key, std::uint32_t version) const {
	return load(key, version);
}

std::optional<ModelArtifact> SqliteArtifactRepository::load(const ModelKey &key,
                                                            const std::optional<std::uint32_t> &version) const {
	auto guard = db_->lock();
	std::string sql = "SELECT version, trained_at, window_size, units_1, units_2, dropout, scaler_min, scaler_max, "
	                  "train_rmse, train_mae, train_r2, train_n, val_rmse, val_mae, val_r2, val_n, "
	                  "certification, weights FROM model_artifacts WHERE station_id = ? AND parameter = ?";
	sql += version ? " AND version = ?" : " ORDER BY version DESC LIMIT 1";
	auto stmt = db_->prepare(sql);
	stmt.bindText(1, key.station_id).bindText(2, core::parameterName(key.parameter));
	if (version) {
		stmt.bindInt64(3, *version);
	}
	if (!stmt.step()) {
		return std::nullopt;
	}

	models::LstmConfig config;
	config.window_size = static_cast<std::size_t>(stmt.columnInt64(2));
	config.units_1 = static_cast<std::size_t>(stmt.columnInt64(3));
	config.units_2 = static_cast<std::size_t>(stmt.columnInt64(4));
	config.dropout = stmt.columnDouble(5);

	auto model = models::LstmRegressorBuilder().withConfig(config).build();
	const auto weights = stmt.columnBlob(17);
	model->setParameters(Eigen::Map<const Eigen::VectorXd>(weights.data(), static_cast<Eigen::Index>(weights.size())));

	ModelArtifact artifact;
	artifact.key = key;
	artifact.version = static_cast<std::uint32_t>(stmt.columnInt64(0));
	artifact.trained_at = fromEpochSeconds(stmt.columnInt64(1));
	artifact.scaler.withDataRange(stmt.columnDouble(6), stmt.columnDouble(7));
	artifact.train_metrics = readMetrics(stmt, 8);
	artifact.validation_metrics = readMetrics(stmt, 12);
	artifact.certification = parseCertification(stmt.columnText(16));
	artifact.model = std::move(model);
	return artifact;
}

std::vector<ArtifactInfo> SqliteArtifactRepository::versions(const ModelKey &key) const {
	auto guard = db_->lock();
	auto stmt = db_->prepare("SELECT version, trained_at, certification, val_rmse FROM model_artifacts "
	                         "WHERE station_id = ? AND parameter = ? ORDER BY version");
	stmt.bindText(1, key.station_id).bindText(2, core::parameterName(key.parameter));

	std::vector<ArtifactInfo> infos;
	while (stmt.step()) {
		ArtifactInfo info;
		info.key = key;
		info.version = static_cast<std::uint32_t>(stmt.columnInt64(0));
		info.trained_at = fromEpochSeconds(stmt.columnInt64(1));
		info.certification = parseCertification(stmt.columnText(2));
		info.validation_rmse = stmt.columnOptionalDouble(3).value_or(std::numeric_limits<double>::quiet_NaN());
		infos.push_back(std::move(info));
	}
	return infos;
}

void SqliteArtifactRepository::setCertification(const ModelKey &key, std::uint32_t version,
                                                Certification certification) {
	auto guard = db_->lock();
	auto stmt = db_->prepare("UPDATE model_artifacts SET certification = ? "
	                         "WHERE station_id = ? AND parameter = ? AND version = ?");
	stmt.bindText(1, certificationName(certification))
	    .bindText(2, key.station_id)
	    .bindText(3, core::parameterName(key.parameter))
	    .bindInt64(4, version);
	stmt.run();
	if (db_->changes() == 0) {
		throw std::invalid_argument("No model " + versionTag(version) + " for " + key.toString());
	}
}

std::size_t SqliteArtifactRepository::prune(const ModelKey &key, std::size_t keep_latest) {
	// The newest version must survive: publish numbers from it.
	if (keep_latest == 0) {
		throw std::invalid_argument("prune must keep at least the active version.");
	}
	auto guard = db_->lock();
	auto stmt = db_->prepare("DELETE FROM model_artifacts WHERE station_id = ? AND parameter = ? AND version NOT IN "
	                         "(SELECT version FROM model_artifacts WHERE station_id = ? AND parameter = ? "
	                         "ORDER BY version DESC LIMIT ?)");
	const auto parameter = core::parameterName(key.parameter);
	stmt.bindText(1, key.station_id)
	    .bindText(2, parameter)
	    .bindText(3, key.station_id)
	    .bindText(4, parameter)
	    .bindInt64(5, static_cast<std::int64_t>(keep_latest));
	stmt.run();
	const auto removed = static_cast<std::size_t>(db_->changes());
	if (removed > 0) {
		GAPFILL_INFO("Pruned {} model version(s) of {}.", removed, key.toString());
	}
	return removed;
}

} // namespace gapfill::artifacts
