#include "gapfill/core/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace gapfill::core {

namespace {

void require(bool condition, const std::string &message) {
	if (!condition) {
		throw std::invalid_argument(message);
	}
}

long long parseInteger(const char *key, const std::string &raw) {
	std::size_t consumed = 0;
	long long value = 0;
	try {
		value = std::stoll(raw, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument(std::string(key) + " must be an integer, got '" + raw + "'.");
	}
	if (consumed != raw.size()) {
		throw std::invalid_argument(std::string(key) + " must be an integer, got '" + raw + "'.");
	}
	return value;
}

std::size_t parseCount(const char *key, const std::string &raw) {
	const long long value = parseInteger(key, raw);
	if (value < 0) {
		throw std::invalid_argument(std::string(key) + " must be non-negative.");
	}
	return static_cast<std::size_t>(value);
}

double parseReal(const char *key, const std::string &raw) {
	std::size_t consumed = 0;
	double value = 0.0;
	try {
		value = std::stod(raw, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument(std::string(key) + " must be a number, got '" + raw + "'.");
	}
	if (consumed != raw.size()) {
		throw std::invalid_argument(std::string(key) + " must be a number, got '" + raw + "'.");
	}
	return value;
}

bool parseFlag(const char *key, const std::string &raw) {
	if (raw == "1" || raw == "true" || raw == "TRUE" || raw == "yes" || raw == "on") {
		return true;
	}
	if (raw == "0" || raw == "false" || raw == "FALSE" || raw == "no" || raw == "off") {
		return false;
	}
	throw std::invalid_argument(std::string(key) + " must be a boolean, got '" + raw + "'.");
}

OptimizerKind parseOptimizer(const std::string &raw) {
	if (raw == "adam") {
		return OptimizerKind::Adam;
	}
	if (raw == "lbfgs") {
		return OptimizerKind::LBFGS;
	}
	throw std::invalid_argument("GAPFILL_OPTIMIZER must be 'adam' or 'lbfgs', got '" + raw + "'.");
}

FallbackMethod parseFallback(const std::string &raw) {
	if (raw == "none") {
		return FallbackMethod::None;
	}
	if (raw == "linear") {
		return FallbackMethod::LinearInterpolation;
	}
	if (raw == "forward_fill") {
		return FallbackMethod::ForwardFill;
	}
	throw std::invalid_argument("GAPFILL_FALLBACK must be 'none', 'linear' or 'forward_fill', got '" + raw + "'.");
}

} // namespace

void GapConfig::validate() const {
	require(short_gap_max_h >= 1, "short_gap_max_h must be at least 1.");
	require(medium_gap_max_h > short_gap_max_h, "medium_gap_max_h must exceed short_gap_max_h.");
}

void AnomalyConfig::validate() const {
	require(spike_factor > 1.0, "spike_factor must be greater than 1.");
	require(spike_min_base > 0.0, "spike_min_base must be positive.");
	require(max_rate_per_hour > 0.0, "max_rate_per_hour must be positive.");
	require(stuck_run_hours >= 2, "stuck_run_hours must be at least 2.");
}

void ContextConfig::validate() const {
	require(context_window_size >= 1, "context_window_size must be at least 1.");
	require(context_window_size <= 168, "context_window_size cannot exceed 168 hours (1 week).");
}

void TrainerConfig::validate() const {
	require(units_1 >= 1 && units_2 >= 1, "Recurrent layer units must be at least 1.");
	require(dropout >= 0.0 && dropout < 1.0, "dropout must be in [0, 1).");
	require(learning_rate > 0.0, "learning_rate must be positive.");
	require(batch_size >= 1 && batch_size <= 512, "batch_size must be between 1 and 512.");
	require(max_epochs >= 1 && max_epochs <= 1000, "max_epochs must be between 1 and 1000.");
	require(patience >= 1, "patience must be at least 1.");
	require(validation_split > 0.0 && validation_split < 1.0, "validation_split must be in (0, 1).");
	require(lbfgs_iterations_per_epoch >= 1, "lbfgs_iterations_per_epoch must be at least 1.");
	require(weight_bound > 0.0, "weight_bound must be positive.");
	require(divergence_threshold > 0.0, "divergence_threshold must be positive.");
}

void ValidatorConfig::validate() const {
	require(validation_sample_fraction > 0.0 && validation_sample_fraction <= 1.0,
	        "validation_sample_fraction must be in (0, 1].");
	require(min_r2 < 1.0, "min_r2 must be below 1.");
}

void CacheConfig::validate() const {
	require(ttl.count() >= 0, "cache ttl must be non-negative.");
}

void SweepConfig::validate() const {
	require(workers >= 1 && workers <= 64, "workers must be between 1 and 64.");
}

void EngineConfig::validate() const {
	gaps.validate();
	anomalies.validate();
	context.validate();
	trainer.validate();
	validator.validate();
	cache.validate();
	sweep.validate();
	require(trainer.min_history_hours >= context.context_window_size + 1,
	        "min_history_hours must be at least context_window_size + 1.");
}

EngineConfig EngineConfig::fromEnvironment() {
	return fromEnvironment(EngineConfig{}, [](const char *key) -> const char * { return std::getenv(key); });
}

EngineConfig EngineConfig::fromEnvironment(EngineConfig config,
                                           const std::function<const char *(const char *)> &lookup) {
	const auto read = [&lookup](const char *key) -> std::optional<std::string> {
		const char *raw = lookup(key);
		if (raw == nullptr || *raw == '\0') {
			return std::nullopt;
		}
		return std::string(raw);
	};

	if (auto v = read("GAPFILL_SHORT_GAP_MAX_H")) {
		config.gaps.short_gap_max_h = static_cast<int>(parseInteger("GAPFILL_SHORT_GAP_MAX_H", *v));
	}
	if (auto v = read("GAPFILL_MEDIUM_GAP_MAX_H")) {
		config.gaps.medium_gap_max_h = static_cast<int>(parseInteger("GAPFILL_MEDIUM_GAP_MAX_H", *v));
	}
	if (auto v = read("GAPFILL_CONTEXT_WINDOW_SIZE")) {
		config.context.context_window_size = parseCount("GAPFILL_CONTEXT_WINDOW_SIZE", *v);
	}
	if (auto v = read("GAPFILL_ALLOW_IMPUTED_CONTEXT")) {
		config.context.allow_imputed_context = parseFlag("GAPFILL_ALLOW_IMPUTED_CONTEXT", *v);
	}
	if (auto v = read("GAPFILL_SCREEN_ANOMALIES")) {
		config.context.screen_anomalies = parseFlag("GAPFILL_SCREEN_ANOMALIES", *v);
	}
	if (auto v = read("GAPFILL_MIN_HISTORY_HOURS")) {
		config.trainer.min_history_hours = parseCount("GAPFILL_MIN_HISTORY_HOURS", *v);
	}
	if (auto v = read("GAPFILL_LSTM_UNITS_1")) {
		config.trainer.units_1 = parseCount("GAPFILL_LSTM_UNITS_1", *v);
	}
	if (auto v = read("GAPFILL_LSTM_UNITS_2")) {
		config.trainer.units_2 = parseCount("GAPFILL_LSTM_UNITS_2", *v);
	}
	if (auto v = read("GAPFILL_DROPOUT")) {
		config.trainer.dropout = parseReal("GAPFILL_DROPOUT", *v);
	}
	if (auto v = read("GAPFILL_LEARNING_RATE")) {
		config.trainer.learning_rate = parseReal("GAPFILL_LEARNING_RATE", *v);
	}
	if (auto v = read("GAPFILL_BATCH_SIZE")) {
		config.trainer.batch_size = parseCount("GAPFILL_BATCH_SIZE", *v);
	}
	if (auto v = read("GAPFILL_EPOCHS")) {
		config.trainer.max_epochs = parseCount("GAPFILL_EPOCHS", *v);
	}
	if (auto v = read("GAPFILL_PATIENCE")) {
		config.trainer.patience = parseCount("GAPFILL_PATIENCE", *v);
	}
	if (auto v = read("GAPFILL_VALIDATION_SPLIT")) {
		config.trainer.validation_split = parseReal("GAPFILL_VALIDATION_SPLIT", *v);
	}
	if (auto v = read("GAPFILL_OPTIMIZER")) {
		config.trainer.optimizer = parseOptimizer(*v);
	}
	if (auto v = read("GAPFILL_SEED")) {
		const auto seed = static_cast<std::uint32_t>(parseCount("GAPFILL_SEED", *v));
		config.trainer.seed = seed;
		config.validator.seed = seed;
	}
	if (auto v = read("GAPFILL_VALIDATION_SAMPLE_FRACTION")) {
		config.validator.validation_sample_fraction = parseReal("GAPFILL_VALIDATION_SAMPLE_FRACTION", *v);
	}
	if (auto v = read("GAPFILL_MIN_R2")) {
		config.validator.min_r2 = parseReal("GAPFILL_MIN_R2", *v);
	}
	if (auto v = read("GAPFILL_REQUIRE_CERTIFICATION")) {
		config.imputer.require_certification = parseFlag("GAPFILL_REQUIRE_CERTIFICATION", *v);
	}
	if (auto v = read("GAPFILL_FALLBACK")) {
		config.imputer.fallback = parseFallback(*v);
	}
	if (auto v = read("GAPFILL_CACHE_TTL_SECONDS")) {
		config.cache.ttl = std::chrono::seconds{parseInteger("GAPFILL_CACHE_TTL_SECONDS", *v)};
	}
	if (auto v = read("GAPFILL_WORKERS")) {
		config.sweep.workers = parseCount("GAPFILL_WORKERS", *v);
	}
	if (auto v = read("GAPFILL_LOG_LEVEL")) {
		config.log_level = *v;
	}

	config.validate();
	return config;
}

std::string optimizerName(OptimizerKind kind) {
	switch (kind) {
	case OptimizerKind::Adam:
		return "adam";
	case OptimizerKind::LBFGS:
		return "lbfgs";
	}
	return "unknown";
}

std::string fallbackName(FallbackMethod method) {
	switch (method) {
	case FallbackMethod::None:
		return "none";
	case FallbackMethod::LinearInterpolation:
		return "linear";
	case FallbackMethod::ForwardFill:
		return "forward_fill";
	}
	return "unknown";
}

} // namespace gapfill::core
