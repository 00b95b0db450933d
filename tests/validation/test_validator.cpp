#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "gapfill/artifacts/sqlite_artifact_repository.hpp"
#include "gapfill/validation/validator.hpp"

#include "common/model_fixtures.hpp"
#include "common/store_fixtures.hpp"

using namespace gapfill;
using tests::helpers::constantArtifact;
using tests::helpers::hour;
using validation::ValidationStatus;

namespace {

constexpr std::size_t kWindow = 6;

struct ValidatorFixture : tests::helpers::StoreFixture {
	std::shared_ptr<artifacts::SqliteArtifactRepository> repository =
	    std::make_shared<artifacts::SqliteArtifactRepository>(db);
	std::shared_ptr<artifacts::TtlModelCache> cache =
	    std::make_shared<artifacts::TtlModelCache>(repository, std::chrono::seconds{3600});
	artifacts::ModelKey key{"s1", core::Parameter::PM25};

	validation::Validator validator(core::ValidatorConfig config = {}) {
		return validation::Validator(store, repository, cache, audit, config);
	}
};

core::HourlySeries ramp(std::size_t n) {
	core::HourlySeries series;
	for (std::size_t h = 0; h < n; ++h) {
		series.push_back({hour(static_cast<int>(h)), 10.0 + 0.5 * static_cast<double>(h), false});
	}
	return series;
}

core::HourlySeries noisyConstant(std::size_t n, double level, double amplitude) {
	const auto values = tests::helpers::noisyLevel(n, level, amplitude);
	core::HourlySeries series;
	for (std::size_t h = 0; h < n; ++h) {
		series.push_back({hour(static_cast<int>(h)), *values[h], false});
	}
	return series;
}

} // namespace

TEST_CASE("Validation without a model is reported and not logged", "[validation]") {
	ValidatorFixture f;
	tests::helpers::writeValues(*f.store, "s1", tests::helpers::noisyLevel(100, 40.0, 1.0));

	const auto outcome = f.validator().validate(f.key);
	REQUIRE(outcome.status == ValidationStatus::ModelUnavailable);
	REQUIRE_FALSE(outcome.model_version.has_value());
	REQUIRE(f.audit->validationHistory("s1", core::Parameter::PM25).empty());
	REQUIRE_THROWS_AS(f.validator().validate({"nowhere", core::Parameter::PM25}), std::invalid_argument);
}

TEST_CASE("A model that explains no variance is rejected even when it beats interpolation", "[validation]") {
	ValidatorFixture f;
	tests::helpers::writeValues(*f.store, "s1", tests::helpers::alternating(300, 50.0, 2.0, 0.2));
	f.repository->publish(constantArtifact("s1", kWindow, 50.0));
	REQUIRE(f.cache->get(f.key)->certification == artifacts::Certification::Pending);

	const auto outcome = f.validator().validate(f.key);
	REQUIRE(outcome.status == ValidationStatus::Completed);
	REQUIRE(outcome.candidate_points == 30);
	REQUIRE(outcome.test_samples > 0);
	REQUIRE(outcome.test_samples <= outcome.candidate_points);
	REQUIRE(outcome.model.rmse < outcome.linear.rmse);
	REQUIRE(outcome.improvement_over_linear > 0.0);
	REQUIRE(outcome.model.r2OrZero() <= 0.5);
	REQUIRE_FALSE(outcome.certified);

	REQUIRE(f.repository->active(f.key)->certification == artifacts::Certification::Rejected);
	REQUIRE(f.cache->get(f.key)->certification == artifacts::Certification::Rejected);

	const auto history = f.audit->validationHistory("s1", core::Parameter::PM25);
	REQUIRE(history.size() == 1);
	REQUIRE(history[0].model_version == 1);
	REQUIRE(history[0].test_samples == outcome.test_samples);
	REQUIRE_FALSE(history[0].certified);
	REQUIRE(history[0].model_metrics.rmse == Catch::Approx(outcome.model.rmse));
}

TEST_CASE("Predicting the level of a noisy constant beats interpolation but explains no variance",
          "[validation]") {
	// Interpolating across independent noise adds the neighbours' noise; the level does not.
	const auto artifact = constantArtifact("s1", kWindow, 40.0);
	const auto outcome = validation::evaluateModel(artifact, noisyConstant(600, 40.0, 3.0), {});

	REQUIRE(outcome.status == ValidationStatus::Completed);
	REQUIRE(outcome.test_samples >= 30);
	REQUIRE(outcome.model.rmse < outcome.linear.rmse);
	REQUIRE(outcome.improvement_over_linear > 0.0);
	REQUIRE(outcome.model.r2OrZero() < 0.5);
	REQUIRE_FALSE(outcome.certified);
}

TEST_CASE("A model worse than interpolation is rejected", "[validation]") {
	const auto artifact = constantArtifact("s1", kWindow, 30.0);
	const auto outcome = validation::evaluateModel(artifact, ramp(200), {});

	REQUIRE(outcome.status == ValidationStatus::Completed);
	REQUIRE(outcome.linear.rmse == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(outcome.model.rmse > 1.0);
	REQUIRE(outcome.improvement_over_linear == 0.0);
	REQUIRE(outcome.improvement_over_forward_fill < 0.0);
	REQUIRE_FALSE(outcome.certified);
}

TEST_CASE("Held-out draws are reproducible for a seed", "[validation]") {
	const auto artifact = constantArtifact("s1", kWindow, 30.0);
	const auto series = ramp(150);
	core::ValidatorConfig config;
	config.validation_sample_fraction = 0.2;

	const auto first = validation::evaluateModel(artifact, series, config);
	const auto second = validation::evaluateModel(artifact, series, config);
	REQUIRE(first.candidate_points == 30);
	REQUIRE(first.test_samples == second.test_samples);
	REQUIRE(first.model.rmse == second.model.rmse);
	REQUIRE(first.forward_fill.rmse == second.forward_fill.rmse);
}

TEST_CASE("Validation without scorable points is inconclusive", "[validation]") {
	ValidatorFixture f;
	tests::helpers::writeValues(*f.store, "s1", tests::helpers::noisyLevel(8, 40.0, 1.0));
	// No hour of the series has eight predecessors.
	f.repository->publish(constantArtifact("s1", 8, 40.0));

	core::ValidatorConfig config;
	config.validation_sample_fraction = 0.1;
	const auto nothing_drawn = f.validator(config).validate(f.key);
	REQUIRE(nothing_drawn.status == ValidationStatus::InsufficientData);
	REQUIRE(nothing_drawn.candidate_points == 0);

	config.validation_sample_fraction = 0.5;
	const auto no_context = f.validator(config).validate(f.key);
	REQUIRE(no_context.status == ValidationStatus::InsufficientData);
	REQUIRE(no_context.candidate_points == 4);
	REQUIRE(no_context.test_samples == 0);

	REQUIRE(f.repository->active(f.key)->certification == artifacts::Certification::Pending);
	REQUIRE(f.audit->validationHistory("s1", core::Parameter::PM25).size() == 2);
}

TEST_CASE("Imputed values are never held out", "[validation]") {
	ValidatorFixture f;
	tests::helpers::writeValues(*f.store, "s1", tests::helpers::noisyLevel(100, 40.0, 1.0));
	for (int h = 100; h < 120; ++h) {
		tests::helpers::writeValue(*f.store, "s1", h, 40.0, true);
	}
	f.repository->publish(constantArtifact("s1", kWindow, 40.0));

	const auto outcome = f.validator().validate(f.key);
	REQUIRE(outcome.candidate_points == 10);
}

TEST_CASE("Validator settings are checked", "[validation]") {
	ValidatorFixture f;
	core::ValidatorConfig config;
	config.validation_sample_fraction = 0.0;
	REQUIRE_THROWS_AS(f.validator(config), std::invalid_argument);
	REQUIRE_THROWS_AS(validation::evaluateModel(constantArtifact("s1", kWindow, 30.0), ramp(10), config),
	                  std::invalid_argument);
}
