#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gapfill::core {

/**
 * @brief Duration-class thresholds, in hours, both inclusive.
 */
struct GapConfig {
	int short_gap_max_h = 3;   // 1..short_gap_max_h is "short"
	int medium_gap_max_h = 24; // short_gap_max_h+1..medium_gap_max_h is "medium", beyond is "long"

	void validate() const;
};

/**
 * @brief Thresholds for the spike / negative / rate / stuck screen.
 */
struct AnomalyConfig {
	double spike_factor = 5.0;       // value >= factor * previous
	double spike_min_base = 1.0;     // previous values below this are raised to it
	double max_rate_per_hour = 30.0; // absolute change between consecutive hours
	std::size_t stuck_run_hours = 6; // identical consecutive values

	void validate() const;
};

struct ContextConfig {
	std::size_t context_window_size = 24;
	bool allow_imputed_context = true;
	bool screen_anomalies = false;

	void validate() const;
};

enum class OptimizerKind {
	Adam,  // mini-batch, one pass over the training windows per epoch
	LBFGS  // full batch, a bounded number of L-BFGS iterations per epoch
};

struct TrainerConfig {
	std::size_t min_history_hours = 168;
	std::size_t units_1 = 64;
	std::size_t units_2 = 32;
	double dropout = 0.2;
	double learning_rate = 0.001;
	std::size_t batch_size = 32;
	std::size_t max_epochs = 100;
	std::size_t patience = 10;
	double validation_split = 0.2;
	OptimizerKind optimizer = OptimizerKind::Adam;
	int lbfgs_iterations_per_epoch = 20;
	double weight_bound = 50.0;          // box constraint used by the L-BFGS solver
	double divergence_threshold = 1e6;   // scaled-space MSE above this counts as diverged
	std::uint32_t seed = 42;

	void validate() const;
};

struct ValidatorConfig {
	double validation_sample_fraction = 0.1;
	double min_r2 = 0.5;
	std::uint32_t seed = 42;

	void validate() const;
};

enum class FallbackMethod {
	None,
	LinearInterpolation,
	ForwardFill
};

struct ImputerConfig {
	// When false, a trained model that has not been validated yet may impute.
	// A model the validator rejected is never used.
	bool require_certification = false;
	FallbackMethod fallback = FallbackMethod::None;
};

struct CacheConfig {
	std::chrono::seconds ttl{3600};

	void validate() const;
};

struct SweepConfig {
	std::size_t workers = 1;

	void validate() const;
};

/**
 * @struct EngineConfig
 * @brief Every tunable of the gap-fill engine in one place.
 */
struct EngineConfig {
	GapConfig gaps;
	AnomalyConfig anomalies;
	ContextConfig context;
	TrainerConfig trainer;
	ValidatorConfig validator;
	ImputerConfig imputer;
	CacheConfig cache;
	SweepConfig sweep;
	std::optional<std::string> log_level;

	/**
	 * @brief Checks every sub-configuration and their cross-constraints.
	 * @throws std::invalid_argument naming the offending field.
	 */
	void validate() const;

	/**
	 * @brief Defaults overlaid with GAPFILL_* environment variables, validated.
	 */
	static EngineConfig fromEnvironment();

	/**
	 * @brief Overlays variables obtained through @p lookup onto @p base and validates the result.
	 * @param lookup Returns the variable's value or nullptr when unset.
	 */
	static EngineConfig fromEnvironment(EngineConfig base, const std::function<const char *(const char *)> &lookup);
};

std::string optimizerName(OptimizerKind kind);
std::string fallbackName(FallbackMethod method);

} // namespace gapfill::core
