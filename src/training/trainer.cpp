#include "gapfill/training/trainer.hpp"

#include "gapfill/optimization/adam_optimizer.hpp"
#include "gapfill/optimization/lbfgs_optimizer.hpp"
#include "gapfill/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <utility>

namespace gapfill::training {

namespace {

double secondsSince(std::chrono::steady_clock::time_point start) {
	return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::vector<double> toStdVector(const Eigen::VectorXd &v) {
	return std::vector<double>(v.data(), v.data() + v.size());
}

utils::AccuracyMetrics originalUnitMetrics(const models::LstmRegressor &model, const transform::MinMaxScaler &scaler,
                                           const Eigen::MatrixXd &scaled_inputs, const Eigen::VectorXd &targets) {
	std::vector<double> predicted = toStdVector(model.predictBatch(scaled_inputs));
	scaler.inverseTransform(predicted);
	return utils::AccuracyMetrics::compute(toStdVector(targets), predicted);
}

void checkLoss(double loss, double threshold, std::size_t epoch, const char *what) {
	if (!std::isfinite(loss) || loss > threshold) {
		throw TrainingDiverged(std::string(what) + " loss " + std::to_string(loss) + " at epoch " +
		                       std::to_string(epoch));
	}
}

} // namespace

std::string trainingStatusName(TrainingStatus status) {
	switch (status) {
	case TrainingStatus::Completed:
		return "completed";
	case TrainingStatus::InsufficientHistory:
		return "insufficient_history";
	case TrainingStatus::TrainingFailed:
		return "failed";
	}
	return "failed";
}

FittedModel fitModel(const WindowSet &windows, const core::TrainerConfig &config) {
	config.validate();
	const auto split = splitChronologically(windows, config.validation_split);
	const std::size_t window_size = static_cast<std::size_t>(windows.inputs.cols());

	FittedModel fitted;
	fitted.training_samples = split.training.size();
	fitted.validation_samples = split.validation.size();

	// Scaler sees every value of the training windows and nothing later.
	std::vector<double> training_values(split.training.inputs.data(),
	                                    split.training.inputs.data() + split.training.inputs.size());
	training_values.insert(training_values.end(), split.training.targets.data(),
	                       split.training.targets.data() + split.training.targets.size());
	fitted.scaler.fit(training_values);

	const auto &scaler = fitted.scaler;
	const auto scale = [&scaler](double v) { return scaler.transformValue(v); };
	const Eigen::MatrixXd train_x = split.training.inputs.unaryExpr(scale);
	const Eigen::VectorXd train_y = split.training.targets.unaryExpr(scale);
	const Eigen::MatrixXd val_x = split.validation.inputs.unaryExpr(scale);
	const Eigen::VectorXd val_y = split.validation.targets.unaryExpr(scale);

	auto model = models::LstmRegressorBuilder()
	                 .withWindowSize(window_size)
	                 .withUnits(config.units_1, config.units_2)
	                 .withDropout(config.dropout)
	                 .withSeed(config.seed)
	                 .build();

	std::mt19937 rng(config.seed);
	Eigen::VectorXd params = model->parameters();
	Eigen::VectorXd best_params = params;
	double best_loss = std::numeric_limits<double>::infinity();
	std::size_t epochs_without_improvement = 0;

	optimization::AdamOptimizer::Options adam_options;
	adam_options.learning_rate = config.learning_rate;
	optimization::AdamOptimizer adam(static_cast<std::size_t>(params.size()), adam_options);

	optimization::LBFGSOptimizer::Options lbfgs_options;
	lbfgs_options.max_iterations = config.lbfgs_iterations_per_epoch;

	std::vector<std::size_t> order(split.training.size());
	std::iota(order.begin(), order.end(), 0);

	for (std::size_t epoch = 1; epoch <= config.max_epochs; ++epoch) {
		double train_loss = 0.0;
		if (config.optimizer == core::OptimizerKind::Adam) {
			std::shuffle(order.begin(), order.end(), rng);
			Eigen::VectorXd gradient;
			for (std::size_t first = 0; first < order.size(); first += config.batch_size) {
				const std::size_t count = std::min(config.batch_size, order.size() - first);
				Eigen::MatrixXd batch_x(static_cast<Eigen::Index>(count), train_x.cols());
				Eigen::VectorXd batch_y(static_cast<Eigen::Index>(count));
				for (std::size_t i = 0; i < count; ++i) {
					batch_x.row(static_cast<Eigen::Index>(i)) = train_x.row(static_cast<Eigen::Index>(order[first + i]));
					batch_y(static_cast<Eigen::Index>(i)) = train_y(static_cast<Eigen::Index>(order[first + i]));
				}
				const double batch_loss = model->lossAndGradient(batch_x, batch_y, gradient, &rng);
				checkLoss(batch_loss, config.divergence_threshold, epoch, "Training");
				train_loss += batch_loss * static_cast<double>(count);

				adam.step(params, gradient);
				if (!params.allFinite()) {
					throw TrainingDiverged("Non-finite weights at epoch " + std::to_string(epoch));
				}
				model->setParameters(params);
			}
			train_loss /= static_cast<double>(order.size());
		} else {
			auto *raw = model.get();
			auto objective = [raw, &train_x, &train_y](const Eigen::VectorXd &x, Eigen::VectorXd &grad) {
				raw->setParameters(x);
				return raw->lossAndGradient(train_x, train_y, grad);
			};
			const auto result =
			    optimization::LBFGSOptimizer::minimize(objective, params, config.weight_bound, lbfgs_options);
			params = result.x;
			model->setParameters(params);
			train_loss = result.fx;
			checkLoss(train_loss, config.divergence_threshold, epoch, "Training");
		}

		const double val_loss = model->loss(val_x, val_y);
		checkLoss(val_loss, config.divergence_threshold, epoch, "Validation");
		fitted.validation_loss_history.push_back(val_loss);
		fitted.epochs_completed = epoch;
		GAPFILL_TRACE("Epoch {}: train loss {:.6f}, validation loss {:.6f}", epoch, train_loss, val_loss);

		if (val_loss < best_loss) {
			best_loss = val_loss;
			best_params = params;
			epochs_without_improvement = 0;
		} else if (++epochs_without_improvement >= config.patience) {
			GAPFILL_DEBUG("Early stopping after epoch {} (best validation loss {:.6f}).", epoch, best_loss);
			break;
		}
	}

	model->setParameters(best_params);
	fitted.best_validation_loss = best_loss;
	fitted.train_metrics = originalUnitMetrics(*model, fitted.scaler, train_x, split.training.targets);
	fitted.validation_metrics = originalUnitMetrics(*model, fitted.scaler, val_x, split.validation.targets);
	fitted.model = std::move(model);
	return fitted;
}

Trainer::Trainer(std::shared_ptr<const store::ReadingStore> store,
                 std::shared_ptr<artifacts::ArtifactRepository> repository, std::shared_ptr<audit::AuditLog> audit,
                 std::shared_ptr<artifacts::ModelCache> cache, std::shared_ptr<StationLocks> locks,
                 core::TrainerConfig config, std::size_t window_size)
    : store_(std::move(store)), repository_(std::move(repository)), audit_(std::move(audit)),
      cache_(std::move(cache)), locks_(std::move(locks)), config_(config), window_size_(window_size) {
	if (!store_ || !repository_ || !audit_ || !cache_ || !locks_) {
		throw std::invalid_argument("Trainer requires a store, repository, audit log, cache and locks.");
	}
	if (window_size_ == 0) {
		throw std::invalid_argument("Trainer window size must be positive.");
	}
	config_.validate();
}

TrainingOutcome Trainer::train(const artifacts::ModelKey &key) {
	if (!store_->stationExists(key.station_id)) {
		throw std::invalid_argument("Unknown station: " + key.station_id);
	}

	auto lock = locks_->acquire(key);
	const auto started = std::chrono::steady_clock::now();

	TrainingOutcome outcome;
	outcome.key = key;

	std::vector<core::Reading> readings;
	if (const auto bounds = store_->timeBounds(key.station_id)) {
		readings = store_->getReadings(key.station_id, bounds->start, bounds->end);
	}
	const auto series = core::extractSeries(readings, key.parameter, false);
	const auto runs = core::contiguousRuns(series);
	outcome.report.history_hours = series.size();
	outcome.report.contiguous_runs = runs.size();
	outcome.report.usable_runs = static_cast<std::size_t>(
	    std::count_if(runs.begin(), runs.end(), [this](const core::HourlySeries &run) {
		    return run.size() >= window_size_ + 1;
	    }));

	if (series.size() < config_.min_history_hours) {
		outcome.status = TrainingStatus::InsufficientHistory;
		outcome.message = std::to_string(series.size()) + " valid hours, " +
		                  std::to_string(config_.min_history_hours) + " required";
		outcome.report.duration_seconds = secondsSince(started);
		return finish(std::move(outcome));
	}

	const auto windows = buildWindows(runs, window_size_);
	if (windows.size() < 2) {
		outcome.status = TrainingStatus::InsufficientHistory;
		outcome.message = "no contiguous run yields two windows of " + std::to_string(window_size_) + " hours";
		outcome.report.duration_seconds = secondsSince(started);
		return finish(std::move(outcome));
	}

	GAPFILL_INFO("Training {} on {} windows from {} usable run(s).", key.toString(), windows.size(),
	             outcome.report.usable_runs);

	FittedModel fitted;
	try {
		fitted = fitModel(windows, config_);
	} catch (const TrainingDiverged &e) {
		outcome.status = TrainingStatus::TrainingFailed;
		outcome.message = e.what();
		outcome.report.duration_seconds = secondsSince(started);
		GAPFILL_ERROR("Training of {} diverged: {}", key.toString(), e.what());
		return finish(std::move(outcome));
	}

	outcome.report.training_samples = fitted.training_samples;
	outcome.report.validation_samples = fitted.validation_samples;
	outcome.report.epochs_completed = fitted.epochs_completed;
	outcome.report.train_metrics = fitted.train_metrics;
	outcome.report.validation_metrics = fitted.validation_metrics;

	artifacts::ModelArtifact artifact;
	artifact.key = key;
	artifact.trained_at = core::Clock::now();
	artifact.model = std::move(fitted.model);
	artifact.scaler = fitted.scaler;
	artifact.train_metrics = fitted.train_metrics;
	artifact.validation_metrics = fitted.validation_metrics;

	outcome.version = repository_->publish(artifact);
	cache_->invalidate(key);

	outcome.status = TrainingStatus::Completed;
	outcome.report.duration_seconds = secondsSince(started);
	outcome.message = "trained " + artifacts::versionTag(*outcome.version);
	GAPFILL_INFO("Trained {} {} in {:.1f}s: {} epochs, validation RMSE {:.4f}.", key.toString(),
	             artifacts::versionTag(*outcome.version), outcome.report.duration_seconds,
	             outcome.report.epochs_completed, outcome.report.validation_metrics.rmse);
	return finish(std::move(outcome));
}

TrainingOutcome Trainer::finish(TrainingOutcome outcome) {
	if (outcome.status == TrainingStatus::InsufficientHistory) {
		GAPFILL_WARN("Skipping training of {}: {}.", outcome.key.toString(), outcome.message);
	}

	audit::TrainingLogEntry entry;
	entry.station_id = outcome.key.station_id;
	entry.parameter = outcome.key.parameter;
	entry.model_version = outcome.version;
	entry.status = trainingStatusName(outcome.status);
	entry.training_samples = outcome.report.training_samples;
	entry.validation_samples = outcome.report.validation_samples;
	entry.contiguous_runs = outcome.report.contiguous_runs;
	entry.train_metrics = outcome.report.train_metrics;
	entry.validation_metrics = outcome.report.validation_metrics;
	entry.epochs_completed = outcome.report.epochs_completed;
	entry.duration_seconds = outcome.report.duration_seconds;
	entry.message = outcome.message;
	audit_->appendTraining(entry);
	return outcome;
}

} // namespace gapfill::training
