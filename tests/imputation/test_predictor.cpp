#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "gapfill/artifacts/sqlite_artifact_repository.hpp"
#include "gapfill/imputation/predictor.hpp"

#include "common/model_fixtures.hpp"
#include "common/store_fixtures.hpp"

using namespace gapfill;
using tests::helpers::constantArtifact;
using tests::helpers::hour;

namespace {

detect::ContextWindow flatWindow(std::size_t n, double value, int target_hour = 24) {
	detect::ContextWindow window;
	window.station_id = "s1";
	window.target = hour(target_hour);
	for (std::size_t i = 0; i < n; ++i) {
		window.points.push_back({hour(target_hour - static_cast<int>(n - i)), value, false});
	}
	return window;
}

} // namespace

TEST_CASE("Predictions come back in original units with the error bound", "[imputation][predictor]") {
	const auto artifact = constantArtifact("s1", 4, 25.0);
	const auto prediction = imputation::predictWith(artifact, flatWindow(4, 30.0));

	REQUIRE(prediction.value == Catch::Approx(25.0));
	REQUIRE(prediction.raw_value == Catch::Approx(25.0));
	REQUIRE_FALSE(prediction.clamped);
	REQUIRE(prediction.error_bound == std::optional<double>(1.5));
}

TEST_CASE("Predictions are clamped to the parameter range", "[imputation][predictor]") {
	const auto high = imputation::predictWith(constantArtifact("s1", 4, 1200.0), flatWindow(4, 30.0));
	REQUIRE(high.clamped);
	REQUIRE(high.value == 1000.0);
	REQUIRE(high.raw_value == Catch::Approx(1200.0));

	const auto low = imputation::predictWith(constantArtifact("s1", 4, -5.0), flatWindow(4, 30.0));
	REQUIRE(low.clamped);
	REQUIRE(low.value == 0.0);
}

TEST_CASE("A window of the wrong length is rejected", "[imputation][predictor]") {
	const auto artifact = constantArtifact("s1", 4, 25.0);
	REQUIRE_THROWS_AS(imputation::predictWith(artifact, flatWindow(3, 30.0)), std::invalid_argument);

	artifacts::ModelArtifact empty;
	REQUIRE_THROWS_AS(imputation::predictWith(empty, flatWindow(4, 30.0)), std::invalid_argument);
}

TEST_CASE("Certification decides which models may impute", "[imputation][predictor]") {
	tests::helpers::StoreFixture fx;
	auto repository = std::make_shared<artifacts::SqliteArtifactRepository>(fx.db);
	auto cache = std::make_shared<artifacts::TtlModelCache>(repository, std::chrono::seconds{0});
	const artifacts::ModelKey key{"s1", core::Parameter::PM25};

	imputation::Predictor lenient(cache, false);
	imputation::Predictor strict(cache, true);
	REQUIRE_FALSE(lenient.usableModel(key));

	repository->publish(constantArtifact("s1", 4, 25.0));
	REQUIRE(lenient.usableModel(key));
	REQUIRE_FALSE(strict.usableModel(key));

	repository->setCertification(key, 1, artifacts::Certification::Certified);
	REQUIRE(strict.usableModel(key));

	repository->setCertification(key, 1, artifacts::Certification::Rejected);
	REQUIRE_FALSE(lenient.usableModel(key));
	REQUIRE_FALSE(strict.usableModel(key));
}

TEST_CASE("Predictor counts its inferences", "[imputation][predictor]") {
	tests::helpers::StoreFixture fx;
	auto repository = std::make_shared<artifacts::SqliteArtifactRepository>(fx.db);
	auto cache = std::make_shared<artifacts::TtlModelCache>(repository, std::chrono::seconds{60});
	repository->publish(constantArtifact("s1", 4, 25.0));

	imputation::Predictor predictor(cache, false);
	const auto artifact = predictor.usableModel({"s1", core::Parameter::PM25});
	REQUIRE(predictor.invocations() == 0);
	const auto prediction = predictor.predict(*artifact, flatWindow(4, 20.0));
	REQUIRE(prediction.model_version == 1);
	REQUIRE(predictor.invocations() == 1);

	REQUIRE_THROWS_AS(imputation::Predictor(nullptr, false), std::invalid_argument);
}
