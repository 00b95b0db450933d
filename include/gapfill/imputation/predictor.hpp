#pragma once

#include "gapfill/artifacts/model_cache.hpp"
#include "gapfill/detect/context_window.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace gapfill::imputation {

struct Prediction {
	double value = 0.0;     // clamped to the parameter's valid range
	double raw_value = 0.0; // model output in original units
	bool clamped = false;
	std::uint32_t model_version = 0;
	std::optional<double> error_bound; // validation RMSE of the model
};

/**
 * @brief Scales the window, runs the model, inverts the scaling and clamps.
 * @throws std::invalid_argument when the window length differs from the model's.
 * @throws std::runtime_error when the model output is not finite.
 */
Prediction predictWith(const artifacts::ModelArtifact &artifact, const detect::ContextWindow &window);

/**
 * @class Predictor
 * @brief Runs one bounded inference from a context window with the cached active model.
 */
class Predictor {
public:
	Predictor(std::shared_ptr<artifacts::ModelCache> cache, bool require_certification);

	/**
	 * @brief The active artifact if it may impute: never when rejected, and only when
	 *        certified if certification is required.
	 */
	std::shared_ptr<const artifacts::ModelArtifact> usableModel(const artifacts::ModelKey &key) const;

	/// predictWith(), counted.
	Prediction predict(const artifacts::ModelArtifact &artifact, const detect::ContextWindow &window) const;

	/// Number of predict() calls so far.
	std::size_t invocations() const noexcept {
		return invocations_.load();
	}

private:
	std::shared_ptr<artifacts::ModelCache> cache_;
	bool require_certification_;
	mutable std::atomic<std::size_t> invocations_{0};
};

} // namespace gapfill::imputation
