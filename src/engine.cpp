#include "gapfill/engine.hpp"

#include "gapfill/utils/logging.hpp"
#include "gapfill/utils/metrics.hpp"

#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace gapfill {

Engine::Engine(const std::string &path, core::EngineConfig config)
    : Engine(std::make_shared<store::Database>(path), std::move(config)) {
}

Engine::Engine(std::shared_ptr<store::Database> db, core::EngineConfig config)
    : config_(std::move(config)), db_(std::move(db)) {
	if (!db_) {
		throw std::invalid_argument("Engine requires a database.");
	}
	config_.validate();
	if (config_.log_level) {
		utils::Logging::init(*config_.log_level);
	}

	store_ = std::make_shared<store::SqliteReadingStore>(db_);
	audit_ = std::make_shared<audit::SqliteAuditLog>(db_);
	repository_ = std::make_shared<artifacts::SqliteArtifactRepository>(db_);
	cache_ = std::make_shared<artifacts::TtlModelCache>(repository_, config_.cache.ttl);
	locks_ = std::make_shared<training::StationLocks>();
	gaps_ = std::make_shared<detect::GapDetector>(store_, config_.gaps);
	contexts_ = std::make_shared<detect::ContextWindowBuilder>(store_, config_.context, config_.anomalies);
	predictor_ = std::make_shared<imputation::Predictor>(cache_, config_.imputer.require_certification);
	imputer_ = std::make_unique<imputation::Imputer>(store_, audit_, gaps_, contexts_, predictor_, config_.imputer,
	                                                 config_.context);
	trainer_ = std::make_unique<training::Trainer>(store_, repository_, audit_, cache_, locks_, config_.trainer,
	                                               config_.context.context_window_size);
	validator_ = std::make_unique<validation::Validator>(store_, repository_, cache_, audit_, config_.validator);

	GAPFILL_DEBUG("Engine opened on {} (window {}h, fallback {}).", db_->path(), config_.context.context_window_size,
	              core::fallbackName(config_.imputer.fallback));
}

std::vector<core::Gap> Engine::detectGaps(const std::string &station_id, core::TimePoint start, core::TimePoint end,
                                          core::Parameter parameter) const {
	return gaps_->detect(station_id, parameter, start, end).toVector();
}

training::TrainingOutcome Engine::train(const std::string &station_id, core::Parameter parameter) {
	return trainer_->train(artifacts::ModelKey{station_id, parameter});
}

imputation::ImputationOutcome Engine::impute(const std::string &station_id, core::TimePoint timestamp,
                                             core::Parameter parameter) {
	if (!store_->stationExists(station_id)) {
		throw std::invalid_argument("Unknown station: " + station_id);
	}
	return imputer_->impute(artifacts::ModelKey{station_id, parameter}, timestamp);
}

std::vector<imputation::ImputationOutcome> Engine::fillGaps(const std::string &station_id, core::TimePoint start,
                                                            core::TimePoint end, core::Parameter parameter) {
	std::vector<imputation::ImputationOutcome> outcomes;
	for (const auto &gap : gaps_->detect(station_id, parameter, start, end)) {
		auto filled = imputer_->fillGap(gap);
		outcomes.insert(outcomes.end(), std::make_move_iterator(filled.begin()),
		                std::make_move_iterator(filled.end()));
	}
	return outcomes;
}

validation::ValidationOutcome Engine::validate(const std::string &station_id, core::Parameter parameter) {
	return validator_->validate(artifacts::ModelKey{station_id, parameter});
}

bool Engine::rollbackImputation(const std::string &station_id, core::TimePoint timestamp,
                                core::Parameter parameter) {
	return imputer_->rollback(artifacts::ModelKey{station_id, parameter}, timestamp);
}

std::size_t Engine::rollbackRange(const std::string &station_id, core::TimePoint start, core::TimePoint end,
                                  core::Parameter parameter) {
	return imputer_->rollbackRange(artifacts::ModelKey{station_id, parameter}, start, end);
}

ImputationQuality Engine::imputationQuality(const std::string &station_id, core::TimePoint start,
                                            core::TimePoint end, core::Parameter parameter) const {
	if (end < start) {
		throw std::invalid_argument("Quality range must not end before it starts.");
	}

	// Latest logged imputation per hour.
	std::map<core::TimePoint, double> imputed;
	for (const auto &entry : audit_->imputations(station_id, parameter, start, end)) {
		imputed[entry.timestamp] = entry.imputed_value;
	}

	std::vector<double> observed, predicted;
	for (const auto &reading : store_->getReadings(station_id, start, end)) {
		const auto it = imputed.find(reading.timestamp);
		if (it == imputed.end() || !reading.isObserved(parameter)) {
			continue;
		}
		const double value = *reading.value(parameter);
		if (!std::isfinite(value)) {
			continue;
		}
		observed.push_back(value);
		predicted.push_back(it->second);
	}

	ImputationQuality quality;
	quality.samples = observed.size();
	if (observed.empty()) {
		return quality;
	}
	quality.rmse = utils::Metrics::rmse(observed, predicted);
	quality.mae = utils::Metrics::mae(observed, predicted);
	quality.mean_error = utils::Metrics::bias(observed, predicted);
	quality.error_std = utils::Metrics::errorStdDev(observed, predicted);
	return quality;
}

std::size_t Engine::prune(const std::string &station_id, std::size_t keep_latest, core::Parameter parameter) {
	const artifacts::ModelKey key{station_id, parameter};
	const auto removed = repository_->prune(key, keep_latest);
	cache_->invalidate(key);
	return removed;
}

} // namespace gapfill
