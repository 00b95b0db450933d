#pragma once

#include "gapfill/models/sequence_regressor.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <random>

namespace gapfill::models {

class LstmRegressorBuilder;

struct LstmConfig {
	std::size_t window_size = 24;
	std::size_t units_1 = 64;
	std::size_t units_2 = 32;
	/// Applied after each recurrent layer during training only.
	double dropout = 0.2;
};

/// Weights of one LSTM layer; gate blocks are stacked as input, forget, cell, output.
struct LstmLayer {
	Eigen::MatrixXd input_weights;     // 4H x input_dim
	Eigen::MatrixXd recurrent_weights; // 4H x H
	Eigen::VectorXd bias;              // 4H

	Eigen::Index units() const {
		return recurrent_weights.cols();
	}
};

/**
 * @class LstmRegressor
 * @brief Two stacked LSTM layers followed by a dense scalar output.
 *
 * window -> LSTM(units_1, full sequence) -> Dropout -> LSTM(units_2, last state) -> Dropout -> Dense(1).
 * Batches are passed as matrices with one sample per row and one time step per column.
 */
class LstmRegressor final : public SequenceRegressor {
public:
	friend class LstmRegressorBuilder;

	std::size_t windowSize() const override {
		return config_.window_size;
	}
	double predict(const std::vector<double> &window) const override;
	std::string getName() const override {
		return "LSTM";
	}

	/// Inference for a batch; dropout is disabled.
	Eigen::VectorXd predictBatch(const Eigen::MatrixXd &inputs) const;

	/// Mean squared error of the batch without dropout.
	double loss(const Eigen::MatrixXd &inputs, const Eigen::VectorXd &targets) const;

	/**
	 * @brief Mean squared error and its gradient with respect to parameters().
	 * @param dropout_rng Source for dropout masks; nullptr evaluates the deterministic network.
	 */
	double lossAndGradient(const Eigen::MatrixXd &inputs, const Eigen::VectorXd &targets, Eigen::VectorXd &gradient,
	                       std::mt19937 *dropout_rng = nullptr) const;

	std::size_t parameterCount() const noexcept;
	/// Flattened weights: layer 1, layer 2 (each input, recurrent, bias), dense weights, dense bias.
	Eigen::VectorXd parameters() const;
	void setParameters(const Eigen::VectorXd &params);

	/// Glorot-uniform weights, zero biases except a unit forget-gate bias.
	void initialize(std::uint32_t seed);

	const LstmConfig &config() const noexcept {
		return config_;
	}

private:
	explicit LstmRegressor(LstmConfig config);

	void validateBatch(const Eigen::MatrixXd &inputs) const;

	LstmConfig config_;
	LstmLayer layer1_;
	LstmLayer layer2_;
	Eigen::RowVectorXd dense_weights_;
	double dense_bias_ = 0.0;
};

/**
 * @class LstmRegressorBuilder
 * @brief Fluent configuration of LstmRegressor instances.
 */
class LstmRegressorBuilder {
public:
	LstmRegressorBuilder &withWindowSize(std::size_t window_size);
	LstmRegressorBuilder &withUnits(std::size_t units_1, std::size_t units_2);
	LstmRegressorBuilder &withDropout(double dropout);
	LstmRegressorBuilder &withSeed(std::uint32_t seed);
	LstmRegressorBuilder &withConfig(const LstmConfig &config);

	/// @throws std::invalid_argument on zero sizes or a dropout outside [0, 1).
	std::unique_ptr<LstmRegressor> build();

private:
	LstmConfig config_;
	std::uint32_t seed_ = 42;
};

} // namespace gapfill::models
