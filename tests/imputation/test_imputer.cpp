#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "gapfill/artifacts/sqlite_artifact_repository.hpp"
#include "gapfill/imputation/imputer.hpp"

#include "common/model_fixtures.hpp"
#include "common/store_fixtures.hpp"

using namespace gapfill;
using tests::helpers::constantArtifact;
using tests::helpers::hour;
using imputation::ImputationStatus;

namespace {

constexpr std::size_t kWindow = 4;

struct ImputerFixture : tests::helpers::StoreFixture {
	std::shared_ptr<artifacts::SqliteArtifactRepository> repository =
	    std::make_shared<artifacts::SqliteArtifactRepository>(db);
	std::shared_ptr<artifacts::TtlModelCache> cache =
	    std::make_shared<artifacts::TtlModelCache>(repository, std::chrono::seconds{0});
	std::shared_ptr<detect::GapDetector> gaps = std::make_shared<detect::GapDetector>(store);
	core::ContextConfig context = [] {
		core::ContextConfig config;
		config.context_window_size = kWindow;
		return config;
	}();
	std::shared_ptr<detect::ContextWindowBuilder> contexts =
	    std::make_shared<detect::ContextWindowBuilder>(store, context);
	artifacts::ModelKey key{"s1", core::Parameter::PM25};

	/// Ten hours of 30, a missing hour 10, then 30 again up to hour 14.
	void writeSingleGap() {
		std::vector<std::optional<double>> values(15, 30.0);
		values[10] = std::nullopt;
		tests::helpers::writeValues(*store, "s1", values);
	}

	std::shared_ptr<imputation::Predictor> predictor(bool require_certification = false) {
		return std::make_shared<imputation::Predictor>(cache, require_certification);
	}

	imputation::Imputer imputer(std::shared_ptr<const imputation::Predictor> predictor,
	                            core::FallbackMethod fallback = core::FallbackMethod::None,
	                            std::shared_ptr<audit::AuditLog> log = nullptr) {
		core::ImputerConfig config;
		config.fallback = fallback;
		return imputation::Imputer(store, log ? log : audit, gaps, contexts, std::move(predictor), config, context);
	}

	std::optional<core::Reading> readingAt(int h) const {
		for (const auto &reading : store->getReadings("s1", hour(h), hour(h))) {
			return reading;
		}
		return std::nullopt;
	}
};

} // namespace

TEST_CASE("A missing hour is imputed with the active model and logged", "[imputation][imputer]") {
	ImputerFixture f;
	f.writeSingleGap();
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto predictor = f.predictor();
	auto imputer = f.imputer(predictor);

	const auto outcome = imputer.impute(f.key, hour(10));
	REQUIRE(outcome.status == ImputationStatus::Imputed);
	REQUIRE(outcome.filled());
	REQUIRE(*outcome.value == Catch::Approx(25.0));
	REQUIRE(outcome.model_version == std::optional<std::string>("v1"));
	REQUIRE(outcome.method == "lstm");
	REQUIRE(outcome.gap->hours() == 1);

	const auto reading = f.readingAt(10);
	REQUIRE(reading->isImputed(core::Parameter::PM25));
	REQUIRE(*reading->value(core::Parameter::PM25) == Catch::Approx(25.0));
	REQUIRE(reading->measurements.at(core::Parameter::PM25).model_version == std::optional<std::string>("v1"));

	const auto entry = f.audit->activeImputation("s1", hour(10), core::Parameter::PM25);
	REQUIRE(entry.has_value());
	REQUIRE(entry->window_start == hour(6));
	REQUIRE(entry->window_end == hour(9));
	REQUIRE(entry->error_bound == std::optional<double>(1.5));
	REQUIRE(predictor->invocations() == 1);
}

TEST_CASE("Repeating an imputation with the same model writes nothing", "[imputation][imputer]") {
	ImputerFixture f;
	f.writeSingleGap();
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto predictor = f.predictor();
	auto imputer = f.imputer(predictor);

	REQUIRE(imputer.impute(f.key, hour(10)).status == ImputationStatus::Imputed);
	const auto again = imputer.impute(f.key, hour(10));
	REQUIRE(again.status == ImputationStatus::AlreadyImputed);
	REQUIRE(*again.value == Catch::Approx(25.0));
	REQUIRE(predictor->invocations() == 1);
	REQUIRE(f.audit->imputations("s1", core::Parameter::PM25, hour(0), hour(14)).size() == 1);

	// A newer model replaces the value and supersedes the old entry.
	f.repository->publish(constantArtifact("s1", kWindow, 27.0));
	const auto replaced = imputer.impute(f.key, hour(10));
	REQUIRE(replaced.status == ImputationStatus::Imputed);
	REQUIRE(replaced.model_version == std::optional<std::string>("v2"));
	const auto entries = f.audit->imputations("s1", core::Parameter::PM25, hour(0), hour(14));
	REQUIRE(entries.size() == 2);
	REQUIRE_FALSE(entries[0].isActive());
	REQUIRE(entries[1].isActive());
}

TEST_CASE("Observed hours are left alone", "[imputation][imputer]") {
	ImputerFixture f;
	f.writeSingleGap();
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto predictor = f.predictor();
	auto imputer = f.imputer(predictor);

	const auto outcome = imputer.impute(f.key, hour(5));
	REQUIRE(outcome.status == ImputationStatus::NotMissing);
	REQUIRE(*outcome.value == Catch::Approx(30.0));
	REQUIRE_FALSE(outcome.filled());
	REQUIRE(predictor->invocations() == 0);
}

TEST_CASE("Hours in a long gap never reach the model", "[imputation][imputer]") {
	ImputerFixture f;
	auto values = tests::helpers::noisyLevel(45, 30.0, 1.0);
	values = tests::helpers::withGap(values, 10, 34);
	tests::helpers::writeValues(*f.store, "s1", values);
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto predictor = f.predictor();
	auto imputer = f.imputer(predictor, core::FallbackMethod::LinearInterpolation);

	const auto outcome = imputer.impute(f.key, hour(10));
	REQUIRE(outcome.status == ImputationStatus::GapTooLong);
	REQUIRE(outcome.gap->hours() == 25);

	const auto gap = *outcome.gap;
	const auto outcomes = imputer.fillGap(gap);
	REQUIRE(outcomes.size() == 25);
	for (const auto &o : outcomes) {
		REQUIRE(o.status == ImputationStatus::GapTooLong);
	}
	REQUIRE(predictor->invocations() == 0);
	REQUIRE(f.audit->imputations("s1", core::Parameter::PM25, hour(0), hour(44)).empty());
}

TEST_CASE("An incomplete context leaves the hour missing", "[imputation][imputer]") {
	ImputerFixture f;
	tests::helpers::writeValues(*f.store, "s1", {30.0, 31.0, std::nullopt, 32.0, 33.0});
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto predictor = f.predictor();
	auto imputer = f.imputer(predictor);

	const auto outcome = imputer.impute(f.key, hour(2));
	REQUIRE(outcome.status == ImputationStatus::NoContext);
	REQUIRE_FALSE(f.readingAt(2)->value(core::Parameter::PM25).has_value());
	REQUIRE(predictor->invocations() == 0);
}

TEST_CASE("Without a usable model the configured fallback fills the hour", "[imputation][imputer]") {
	ImputerFixture f;
	tests::helpers::writeValues(*f.store, "s1", {10.0, 10.0, 10.0, 10.0, 10.0, std::nullopt, 20.0});

	SECTION("no fallback") {
		auto imputer = f.imputer(f.predictor());
		REQUIRE(imputer.impute(f.key, hour(5)).status == ImputationStatus::ModelUnavailable);
	}
	SECTION("linear interpolation") {
		auto imputer = f.imputer(f.predictor(), core::FallbackMethod::LinearInterpolation);
		const auto outcome = imputer.impute(f.key, hour(5));
		REQUIRE(outcome.status == ImputationStatus::Imputed);
		REQUIRE(*outcome.value == Catch::Approx(15.0));
		REQUIRE(outcome.method == "linear");
		REQUIRE_FALSE(outcome.model_version.has_value());
		const auto entry = f.audit->activeImputation("s1", hour(5), core::Parameter::PM25);
		REQUIRE(entry->method == "linear");
		REQUIRE(entry->window_start == hour(4));
		REQUIRE(entry->window_end == hour(6));
		REQUIRE(imputer.impute(f.key, hour(5)).status == ImputationStatus::AlreadyImputed);
	}
	SECTION("forward fill") {
		auto imputer = f.imputer(f.predictor(), core::FallbackMethod::ForwardFill);
		REQUIRE(*imputer.impute(f.key, hour(5)).value == Catch::Approx(10.0));
	}
	SECTION("rejected model") {
		f.repository->publish(constantArtifact("s1", kWindow, 25.0));
		f.repository->setCertification(f.key, 1, artifacts::Certification::Rejected);
		auto imputer = f.imputer(f.predictor(), core::FallbackMethod::LinearInterpolation);
		REQUIRE(imputer.impute(f.key, hour(5)).method == "linear");
	}
	SECTION("uncertified model when certification is required") {
		f.repository->publish(constantArtifact("s1", kWindow, 25.0));
		auto imputer = f.imputer(f.predictor(true));
		REQUIRE(imputer.impute(f.key, hour(5)).status == ImputationStatus::ModelUnavailable);
	}
}

TEST_CASE("Filling a gap feeds earlier imputations into later contexts", "[imputation][imputer]") {
	ImputerFixture f;
	auto values = tests::helpers::noisyLevel(20, 30.0, 0.5);
	values = tests::helpers::withGap(values, 10, 12);
	tests::helpers::writeValues(*f.store, "s1", values);
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto imputer = f.imputer(f.predictor());

	const auto gap = f.gaps->gapAt("s1", core::Parameter::PM25, hour(11));
	REQUIRE(gap.has_value());
	const auto outcomes = imputer.fillGap(*gap);
	REQUIRE(outcomes.size() == 3);
	for (const auto &outcome : outcomes) {
		REQUIRE(outcome.status == ImputationStatus::Imputed);
	}
	REQUIRE(f.gaps->detect("s1", core::Parameter::PM25, hour(0), hour(19)).toVector().empty());
	REQUIRE(f.gaps->detect("s1", core::Parameter::PM25, hour(0), hour(19), true).toVector().size() == 1);
}

TEST_CASE("Rolling back restores the missing hour", "[imputation][imputer]") {
	ImputerFixture f;
	auto values = tests::helpers::noisyLevel(20, 30.0, 0.5);
	values = tests::helpers::withGap(values, 10, 11);
	tests::helpers::writeValues(*f.store, "s1", values);
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto imputer = f.imputer(f.predictor());
	imputer.fillGap(*f.gaps->gapAt("s1", core::Parameter::PM25, hour(10)));

	REQUIRE(imputer.rollback(f.key, hour(10)));
	const auto reading = f.readingAt(10);
	REQUIRE_FALSE(reading->value(core::Parameter::PM25).has_value());
	REQUIRE_FALSE(reading->isImputed(core::Parameter::PM25));
	REQUIRE_FALSE(f.audit->activeImputation("s1", hour(10), core::Parameter::PM25).has_value());
	REQUIRE_FALSE(imputer.rollback(f.key, hour(10)));
	REQUIRE_FALSE(imputer.rollback(f.key, hour(3)));

	REQUIRE(imputer.rollbackRange(f.key, hour(0), hour(19)) == 1);
	REQUIRE(f.gaps->detect("s1", core::Parameter::PM25, hour(0), hour(19)).toVector().size() == 1);
	REQUIRE(f.audit->imputations("s1", core::Parameter::PM25, hour(0), hour(19)).size() == 2);
	REQUIRE_THROWS_AS(imputer.rollbackRange(f.key, hour(5), hour(4)), std::invalid_argument);
}

TEST_CASE("A failed log write reverts the imputed value", "[imputation][imputer]") {
	ImputerFixture f;
	f.writeSingleGap();
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto failing = std::make_shared<tests::helpers::FailingAuditLog>(f.audit);
	failing->fail_imputation_writes = true;
	auto imputer = f.imputer(f.predictor(), core::FallbackMethod::None, failing);

	REQUIRE_THROWS_AS(imputer.impute(f.key, hour(10)), core::StoreUnavailable);
	const auto reading = f.readingAt(10);
	REQUIRE_FALSE(reading->value(core::Parameter::PM25).has_value());
	REQUIRE_FALSE(reading->isImputed(core::Parameter::PM25));
	REQUIRE(f.audit->imputations("s1", core::Parameter::PM25, hour(0), hour(14)).empty());

	failing->fail_imputation_writes = false;
	REQUIRE(imputer.impute(f.key, hour(10)).status == ImputationStatus::Imputed);
}

TEST_CASE("Imputation requests are validated", "[imputation][imputer]") {
	ImputerFixture f;
	f.writeSingleGap();
	auto imputer = f.imputer(f.predictor());
	REQUIRE_THROWS_AS(imputer.impute({"nowhere", core::Parameter::PM25}, hour(1)), std::invalid_argument);
	REQUIRE_THROWS_AS(imputer.impute(f.key, hour(10) + std::chrono::minutes(5)), std::invalid_argument);
}

TEST_CASE("Re-imputing after a rollback reproduces the value", "[imputation][imputer]") {
	ImputerFixture f;
	f.writeSingleGap();
	f.repository->publish(constantArtifact("s1", kWindow, 25.0));
	auto imputer = f.imputer(f.predictor());

	const auto original = imputer.impute(f.key, hour(10));
	REQUIRE(imputer.rollback(f.key, hour(10)));
	const auto repeated = imputer.impute(f.key, hour(10));
	REQUIRE(repeated.status == ImputationStatus::Imputed);
	REQUIRE(*repeated.value == *original.value);
	REQUIRE(repeated.model_version == original.model_version);

	const auto entries = f.audit->imputations("s1", core::Parameter::PM25, hour(10), hour(10));
	REQUIRE(entries.size() == 2);
	REQUIRE(entries[0].superseded_reason == std::optional<std::string>("rolled back"));
	REQUIRE(entries[1].isActive());
}
