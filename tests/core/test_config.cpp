#include <catch2/catch_test_macros.hpp>

#include "gapfill/core/config.hpp"

#include <map>
#include <stdexcept>
#include <string>

using namespace gapfill::core;

namespace {

std::function<const char *(const char *)> lookupFrom(const std::map<std::string, std::string> &vars) {
	return [&vars](const char *key) -> const char * {
		const auto it = vars.find(key);
		return it == vars.end() ? nullptr : it->second.c_str();
	};
}

} // namespace

TEST_CASE("Default engine configuration is valid", "[core][config]") {
	const EngineConfig config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.gaps.short_gap_max_h == 3);
	REQUIRE(config.gaps.medium_gap_max_h == 24);
	REQUIRE(config.context.context_window_size == 24);
	REQUIRE(config.trainer.min_history_hours == 168);
	REQUIRE(config.validator.validation_sample_fraction == 0.1);
	REQUIRE(config.imputer.fallback == FallbackMethod::None);
}

TEST_CASE("Configuration validation names the offending field", "[core][config]") {
	SECTION("context window above one week") {
		EngineConfig config;
		config.context.context_window_size = 169;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("thresholds out of order") {
		GapConfig gaps;
		gaps.short_gap_max_h = 24;
		gaps.medium_gap_max_h = 24;
		REQUIRE_THROWS_AS(gaps.validate(), std::invalid_argument);
	}
	SECTION("history shorter than one window") {
		EngineConfig config;
		config.trainer.min_history_hours = 24;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("dropout of one") {
		TrainerConfig trainer;
		trainer.dropout = 1.0;
		REQUIRE_THROWS_AS(trainer.validate(), std::invalid_argument);
	}
	SECTION("too many workers") {
		SweepConfig sweep;
		sweep.workers = 65;
		REQUIRE_THROWS_AS(sweep.validate(), std::invalid_argument);
	}
}

TEST_CASE("Environment variables overlay the defaults", "[core][config]") {
	const std::map<std::string, std::string> vars{{"GAPFILL_CONTEXT_WINDOW_SIZE", "12"},
	                                              {"GAPFILL_MIN_R2", "0.3"},
	                                              {"GAPFILL_CACHE_TTL_SECONDS", "60"},
	                                              {"GAPFILL_FALLBACK", "forward_fill"},
	                                              {"GAPFILL_OPTIMIZER", "lbfgs"},
	                                              {"GAPFILL_SEED", "9"},
	                                              {"GAPFILL_LOG_LEVEL", "debug"},
	                                              {"GAPFILL_SCREEN_ANOMALIES", "true"}};
	const auto config = EngineConfig::fromEnvironment(EngineConfig{}, lookupFrom(vars));

	REQUIRE(config.context.context_window_size == 12);
	REQUIRE(config.validator.min_r2 == 0.3);
	REQUIRE(config.cache.ttl == std::chrono::seconds{60});
	REQUIRE(config.imputer.fallback == FallbackMethod::ForwardFill);
	REQUIRE(config.trainer.optimizer == OptimizerKind::LBFGS);
	REQUIRE(config.trainer.seed == 9);
	REQUIRE(config.validator.seed == 9);
	REQUIRE(config.log_level == std::string("debug"));
	REQUIRE(config.context.screen_anomalies);
	REQUIRE(optimizerName(config.trainer.optimizer) == "lbfgs");
	REQUIRE(fallbackName(config.imputer.fallback) == "forward_fill");
}

TEST_CASE("Malformed environment values are rejected", "[core][config]") {
	const std::map<std::string, std::string> not_a_number{{"GAPFILL_EPOCHS", "ten"}};
	REQUIRE_THROWS_AS(EngineConfig::fromEnvironment(EngineConfig{}, lookupFrom(not_a_number)),
	                  std::invalid_argument);

	const std::map<std::string, std::string> out_of_range{{"GAPFILL_VALIDATION_SAMPLE_FRACTION", "1.5"}};
	REQUIRE_THROWS_AS(EngineConfig::fromEnvironment(EngineConfig{}, lookupFrom(out_of_range)),
	                  std::invalid_argument);

	const std::map<std::string, std::string> bad_flag{{"GAPFILL_REQUIRE_CERTIFICATION", "maybe"}};
	REQUIRE_THROWS_AS(EngineConfig::fromEnvironment(EngineConfig{}, lookupFrom(bad_flag)), std::invalid_argument);
}
