#include <catch2/catch_test_macros.hpp>

#include "gapfill/artifacts/sqlite_artifact_repository.hpp"
#include "gapfill/training/trainer.hpp"

#include "common/store_fixtures.hpp"

#include <algorithm>
#include <cmath>

using namespace gapfill;
using tests::helpers::noisyLevel;

namespace {

constexpr std::size_t kWindow = 6;

core::TrainerConfig quickConfig() {
	auto config = tests::helpers::smallTrainerConfig();
	config.units_1 = 8;
	config.units_2 = 4;
	config.max_epochs = 10;
	return config;
}

struct TrainerFixture : tests::helpers::StoreFixture {
	std::shared_ptr<artifacts::SqliteArtifactRepository> repository =
	    std::make_shared<artifacts::SqliteArtifactRepository>(db);
	std::shared_ptr<artifacts::TtlModelCache> cache =
	    std::make_shared<artifacts::TtlModelCache>(repository, std::chrono::seconds{3600});
	std::shared_ptr<training::StationLocks> locks = std::make_shared<training::StationLocks>();
	artifacts::ModelKey key{"s1", core::Parameter::PM25};

	training::Trainer makeTrainer(core::TrainerConfig config = quickConfig()) {
		return training::Trainer(store, repository, audit, cache, locks, config, kWindow);
	}
};

} // namespace

TEST_CASE("Short histories are skipped without publishing", "[training][trainer]") {
	TrainerFixture f;
	tests::helpers::writeValues(*f.store, "s1", noisyLevel(50, 40.0, 1.0));
	auto trainer = f.makeTrainer();

	const auto outcome = trainer.train(f.key);
	REQUIRE(outcome.status == training::TrainingStatus::InsufficientHistory);
	REQUIRE_FALSE(outcome.version.has_value());
	REQUIRE(outcome.report.history_hours == 50);
	REQUIRE(f.repository->versions(f.key).empty());

	const auto history = f.audit->trainingHistory("s1", core::Parameter::PM25);
	REQUIRE(history.size() == 1);
	REQUIRE(history[0].status == "insufficient_history");
	REQUIRE_FALSE(history[0].model_version.has_value());
}

TEST_CASE("Imputed values do not count as training history", "[training][trainer]") {
	TrainerFixture f;
	tests::helpers::writeValues(*f.store, "s1", noisyLevel(170, 40.0, 1.0));
	for (int h = 100; h < 110; ++h) {
		tests::helpers::writeValue(*f.store, "s1", h, 40.0, true);
	}
	auto trainer = f.makeTrainer();

	const auto outcome = trainer.train(f.key);
	REQUIRE(outcome.status == training::TrainingStatus::InsufficientHistory);
	REQUIRE(outcome.report.history_hours == 160);
	REQUIRE(outcome.report.contiguous_runs == 2);
}

TEST_CASE("Enough hours in runs too short for a window are skipped", "[training][trainer]") {
	TrainerFixture f;
	auto values = noisyLevel(250, 40.0, 1.0);
	for (std::size_t h = 4; h < values.size(); h += 5) {
		values[h] = std::nullopt;
	}
	tests::helpers::writeValues(*f.store, "s1", values);
	auto trainer = f.makeTrainer();

	const auto outcome = trainer.train(f.key);
	REQUIRE(outcome.status == training::TrainingStatus::InsufficientHistory);
	REQUIRE(outcome.report.history_hours == 200);
	REQUIRE(outcome.report.usable_runs == 0);
	REQUIRE_FALSE(outcome.message.empty());
}

TEST_CASE("Training publishes a new pending version", "[training][trainer]") {
	TrainerFixture f;
	tests::helpers::writeValues(*f.store, "s1", noisyLevel(200, 40.0, 1.0));
	auto trainer = f.makeTrainer();

	const auto first = trainer.train(f.key);
	REQUIRE(first.succeeded());
	REQUIRE(first.version == std::optional<std::uint32_t>(1));
	REQUIRE(first.report.epochs_completed >= 1);
	REQUIRE(first.report.training_samples + first.report.validation_samples == 200 - kWindow);
	REQUIRE(std::isfinite(first.report.validation_metrics.rmse));

	const auto active = f.cache->get(f.key);
	REQUIRE(active);
	REQUIRE(active->version == 1);
	REQUIRE(active->certification == artifacts::Certification::Pending);
	REQUIRE(active->windowSize() == kWindow);

	const auto second = trainer.train(f.key);
	REQUIRE(second.version == std::optional<std::uint32_t>(2));
	REQUIRE(f.cache->get(f.key)->version == 2);

	const auto history = f.audit->trainingHistory("s1", core::Parameter::PM25);
	REQUIRE(history.size() == 2);
	REQUIRE(history[0].status == "completed");
	REQUIRE(history[1].model_version == std::optional<std::uint32_t>(2));
}

TEST_CASE("The L-BFGS optimizer can train a model", "[training][trainer]") {
	TrainerFixture f;
	tests::helpers::writeValues(*f.store, "s1", noisyLevel(200, 40.0, 1.0));
	auto config = quickConfig();
	config.optimizer = core::OptimizerKind::LBFGS;
	config.max_epochs = 3;
	config.lbfgs_iterations_per_epoch = 5;
	auto trainer = f.makeTrainer(config);

	const auto outcome = trainer.train(f.key);
	REQUIRE(outcome.succeeded());
	REQUIRE(outcome.report.epochs_completed >= 1);
	REQUIRE(outcome.report.epochs_completed <= 3);
}

TEST_CASE("Diverging training keeps the previous version active", "[training][trainer]") {
	TrainerFixture f;
	tests::helpers::writeValues(*f.store, "s1", noisyLevel(200, 40.0, 1.0));
	REQUIRE(f.makeTrainer().train(f.key).version == std::optional<std::uint32_t>(1));

	auto config = quickConfig();
	config.divergence_threshold = 1e-12;
	const auto outcome = f.makeTrainer(config).train(f.key);
	REQUIRE(outcome.status == training::TrainingStatus::TrainingFailed);
	REQUIRE_FALSE(outcome.version.has_value());
	REQUIRE(f.repository->active(f.key)->version == 1);
	REQUIRE(f.audit->trainingHistory("s1", core::Parameter::PM25).back().status == "failed");
}

TEST_CASE("Fitting scales with the training split only", "[training][trainer]") {
	core::HourlySeries rising;
	for (int h = 0; h < 60; ++h) {
		rising.push_back({tests::helpers::hour(h), static_cast<double>(h), false});
	}
	const auto windows = training::buildWindows({rising}, 4);
	auto config = quickConfig();
	config.max_epochs = 3;

	const auto fitted = training::fitModel(windows, config);
	REQUIRE(fitted.model);
	REQUIRE(fitted.scaler.isFitted());
	REQUIRE(fitted.scaler.inputMin() == 0.0);
	REQUIRE(fitted.scaler.inputMax() < 59.0);
	REQUIRE(fitted.validation_loss_history.size() == fitted.epochs_completed);
	REQUIRE(fitted.training_samples + fitted.validation_samples == windows.size());
}

TEST_CASE("Training reports bad requests and store failures", "[training][trainer]") {
	TrainerFixture f;
	auto trainer = f.makeTrainer();
	REQUIRE_THROWS_AS(trainer.train({"nowhere", core::Parameter::PM25}), std::invalid_argument);

	training::Trainer offline(std::make_shared<tests::helpers::UnavailableReadingStore>(), f.repository, f.audit,
	                          f.cache, f.locks, quickConfig(), kWindow);
	REQUIRE_THROWS_AS(offline.train(f.key), core::StoreUnavailable);
	REQUIRE_THROWS_AS(training::Trainer(f.store, f.repository, f.audit, f.cache, f.locks, quickConfig(), 0),
	                  std::invalid_argument);
}
