#include "gapfill/models/lstm_regressor.hpp"

#include "gapfill/utils/logging.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gapfill::models {

namespace {

struct StepCache {
	Eigen::MatrixXd input;
	Eigen::MatrixXd h_prev;
	Eigen::MatrixXd c_prev;
	Eigen::MatrixXd i;
	Eigen::MatrixXd f;
	Eigen::MatrixXd g;
	Eigen::MatrixXd o;
	Eigen::MatrixXd tanh_c;
};

struct ForwardTrace {
	std::vector<StepCache> layer1;
	std::vector<StepCache> layer2;
	std::vector<Eigen::MatrixXd> mask1; // empty when dropout is off
	Eigen::MatrixXd mask2;
	Eigen::MatrixXd dense_input;
	Eigen::RowVectorXd output;
};

Eigen::MatrixXd sigmoid(const Eigen::MatrixXd &z) {
	return (1.0 / (1.0 + (-z.array()).exp())).matrix();
}

LstmLayer zeroLayer(Eigen::Index input_dim, Eigen::Index units) {
	LstmLayer layer;
	layer.input_weights = Eigen::MatrixXd::Zero(4 * units, input_dim);
	layer.recurrent_weights = Eigen::MatrixXd::Zero(4 * units, units);
	layer.bias = Eigen::VectorXd::Zero(4 * units);
	return layer;
}

std::vector<Eigen::MatrixXd> forwardLayer(const LstmLayer &layer, const std::vector<Eigen::MatrixXd> &inputs,
                                          std::vector<StepCache> *caches) {
	const Eigen::Index units = layer.units();
	const Eigen::Index batch = inputs.front().cols();

	Eigen::MatrixXd h = Eigen::MatrixXd::Zero(units, batch);
	Eigen::MatrixXd c = Eigen::MatrixXd::Zero(units, batch);
	std::vector<Eigen::MatrixXd> outputs;
	outputs.reserve(inputs.size());

	for (const auto &x : inputs) {
		Eigen::MatrixXd z = layer.input_weights * x + layer.recurrent_weights * h;
		z.colwise() += layer.bias;

		Eigen::MatrixXd i = sigmoid(z.topRows(units));
		Eigen::MatrixXd f = sigmoid(z.middleRows(units, units));
		Eigen::MatrixXd g = z.middleRows(2 * units, units).array().tanh().matrix();
		Eigen::MatrixXd o = sigmoid(z.bottomRows(units));

		Eigen::MatrixXd c_next = (f.array() * c.array() + i.array() * g.array()).matrix();
		Eigen::MatrixXd tanh_c = c_next.array().tanh().matrix();
		Eigen::MatrixXd h_next = (o.array() * tanh_c.array()).matrix();

		if (caches) {
			caches->push_back(StepCache{x, h, c, std::move(i), std::move(f), std::move(g), std::move(o), tanh_c});
		}
		h = std::move(h_next);
		c = std::move(c_next);
		outputs.push_back(h);
	}
	return outputs;
}

// Accumulates weight gradients into grad and returns the gradient with respect to each step's input.
std::vector<Eigen::MatrixXd> backwardLayer(const LstmLayer &layer, const std::vector<StepCache> &caches,
                                           const std::vector<Eigen::MatrixXd> &d_outputs, LstmLayer &grad) {
	const Eigen::Index units = layer.units();
	const Eigen::Index batch = caches.front().input.cols();

	Eigen::MatrixXd dh_next = Eigen::MatrixXd::Zero(units, batch);
	Eigen::MatrixXd dc_next = Eigen::MatrixXd::Zero(units, batch);
	std::vector<Eigen::MatrixXd> d_inputs(caches.size());
	Eigen::MatrixXd dz(4 * units, batch);

	for (std::size_t step = caches.size(); step-- > 0;) {
		const auto &s = caches[step];
		const Eigen::ArrayXXd dh = (d_outputs[step] + dh_next).array();

		const Eigen::ArrayXXd d_o = dh * s.tanh_c.array();
		const Eigen::ArrayXXd dc =
		    dc_next.array() + dh * s.o.array() * (1.0 - s.tanh_c.array().square());
		const Eigen::ArrayXXd d_i = dc * s.g.array();
		const Eigen::ArrayXXd d_g = dc * s.i.array();
		const Eigen::ArrayXXd d_f = dc * s.c_prev.array();

		dz.topRows(units) = (d_i * s.i.array() * (1.0 - s.i.array())).matrix();
		dz.middleRows(units, units) = (d_f * s.f.array() * (1.0 - s.f.array())).matrix();
		dz.middleRows(2 * units, units) = (d_g * (1.0 - s.g.array().square())).matrix();
		dz.bottomRows(units) = (d_o * s.o.array() * (1.0 - s.o.array())).matrix();

		grad.input_weights.noalias() += dz * s.input.transpose();
		grad.recurrent_weights.noalias() += dz * s.h_prev.transpose();
		grad.bias += dz.rowwise().sum();

		d_inputs[step] = layer.input_weights.transpose() * dz;
		dh_next = layer.recurrent_weights.transpose() * dz;
		dc_next = (dc * s.f.array()).matrix();
	}
	return d_inputs;
}

Eigen::MatrixXd dropoutMask(Eigen::Index rows, Eigen::Index cols, double rate, std::mt19937 &rng) {
	std::bernoulli_distribution keep(1.0 - rate);
	const double scale = 1.0 / (1.0 - rate);
	Eigen::MatrixXd mask(rows, cols);
	for (Eigen::Index c = 0; c < cols; ++c) {
		for (Eigen::Index r = 0; r < rows; ++r) {
			mask(r, c) = keep(rng) ? scale : 0.0;
		}
	}
	return mask;
}

void fillUniform(Eigen::MatrixXd &m, double limit, std::mt19937 &rng) {
	std::uniform_real_distribution<double> dist(-limit, limit);
	for (Eigen::Index c = 0; c < m.cols(); ++c) {
		for (Eigen::Index r = 0; r < m.rows(); ++r) {
			m(r, c) = dist(rng);
		}
	}
}

void initLayer(LstmLayer &layer, std::mt19937 &rng) {
	const auto units = static_cast<double>(layer.units());
	const auto input_dim = static_cast<double>(layer.input_weights.cols());
	fillUniform(layer.input_weights, std::sqrt(6.0 / (input_dim + 4.0 * units)), rng);
	fillUniform(layer.recurrent_weights, std::sqrt(6.0 / (units + 4.0 * units)), rng);
	layer.bias.setZero();
	layer.bias.segment(layer.units(), layer.units()).setOnes();
}

Eigen::Index layerSize(const LstmLayer &layer) {
	return layer.input_weights.size() + layer.recurrent_weights.size() + layer.bias.size();
}

void packLayer(const LstmLayer &layer, Eigen::VectorXd &out, Eigen::Index &offset) {
	const auto put = [&](const double *data, Eigen::Index n) {
		out.segment(offset, n) = Eigen::Map<const Eigen::VectorXd>(data, n);
		offset += n;
	};
	put(layer.input_weights.data(), layer.input_weights.size());
	put(layer.recurrent_weights.data(), layer.recurrent_weights.size());
	put(layer.bias.data(), layer.bias.size());
}

void unpackLayer(const Eigen::VectorXd &in, LstmLayer &layer, Eigen::Index &offset) {
	const auto take = [&](double *data, Eigen::Index n) {
		Eigen::Map<Eigen::VectorXd>(data, n) = in.segment(offset, n);
		offset += n;
	};
	take(layer.input_weights.data(), layer.input_weights.size());
	take(layer.recurrent_weights.data(), layer.recurrent_weights.size());
	take(layer.bias.data(), layer.bias.size());
}

} // namespace

LstmRegressor::LstmRegressor(LstmConfig config) : config_(config) {
	if (config_.window_size == 0 || config_.units_1 == 0 || config_.units_2 == 0) {
		throw std::invalid_argument("LSTM window size and layer units must be positive.");
	}
	if (config_.dropout < 0.0 || config_.dropout >= 1.0) {
		throw std::invalid_argument("LSTM dropout must lie in [0, 1).");
	}
	const auto units_1 = static_cast<Eigen::Index>(config_.units_1);
	const auto units_2 = static_cast<Eigen::Index>(config_.units_2);
	layer1_ = zeroLayer(1, units_1);
	layer2_ = zeroLayer(units_1, units_2);
	dense_weights_ = Eigen::RowVectorXd::Zero(units_2);
}

void LstmRegressor::initialize(std::uint32_t seed) {
	std::mt19937 rng(seed);
	initLayer(layer1_, rng);
	initLayer(layer2_, rng);
	Eigen::MatrixXd dense(1, dense_weights_.size());
	fillUniform(dense, std::sqrt(6.0 / (static_cast<double>(dense_weights_.size()) + 1.0)), rng);
	dense_weights_ = dense.row(0);
	dense_bias_ = 0.0;
}

std::size_t LstmRegressor::parameterCount() const noexcept {
	return static_cast<std::size_t>(layerSize(layer1_) + layerSize(layer2_) + dense_weights_.size() + 1);
}

Eigen::VectorXd LstmRegressor::parameters() const {
	Eigen::VectorXd out(static_cast<Eigen::Index>(parameterCount()));
	Eigen::Index offset = 0;
	packLayer(layer1_, out, offset);
	packLayer(layer2_, out, offset);
	out.segment(offset, dense_weights_.size()) = dense_weights_.transpose();
	offset += dense_weights_.size();
	out(offset) = dense_bias_;
	return out;
}

void LstmRegressor::setParameters(const Eigen::VectorXd &params) {
	if (params.size() != static_cast<Eigen::Index>(parameterCount())) {
		throw std::invalid_argument("LSTM parameter vector has " + std::to_string(params.size()) +
		                            " entries, expected " + std::to_string(parameterCount()) + ".");
	}
	if (!params.allFinite()) {
		throw std::invalid_argument("LSTM parameters must be finite.");
	}
	Eigen::Index offset = 0;
	unpackLayer(params, layer1_, offset);
	unpackLayer(params, layer2_, offset);
	dense_weights_ = params.segment(offset, dense_weights_.size()).transpose();
	offset += dense_weights_.size();
	dense_bias_ = params(offset);
}

void LstmRegressor::validateBatch(const Eigen::MatrixXd &inputs) const {
	if (inputs.rows() == 0) {
		throw std::invalid_argument("LSTM batch must contain at least one sample.");
	}
	if (inputs.cols() != static_cast<Eigen::Index>(config_.window_size)) {
		throw std::invalid_argument("LSTM batch has " + std::to_string(inputs.cols()) + " time steps, expected " +
		                            std::to_string(config_.window_size) + ".");
	}
	if (!inputs.allFinite()) {
		throw std::invalid_argument("LSTM inputs must be finite.");
	}
}

Eigen::VectorXd LstmRegressor::predictBatch(const Eigen::MatrixXd &inputs) const {
	validateBatch(inputs);
	std::vector<Eigen::MatrixXd> steps;
	steps.reserve(static_cast<std::size_t>(inputs.cols()));
	for (Eigen::Index t = 0; t < inputs.cols(); ++t) {
		steps.emplace_back(inputs.col(t).transpose());
	}
	const auto h1 = forwardLayer(layer1_, steps, nullptr);
	const auto h2 = forwardLayer(layer2_, h1, nullptr);
	Eigen::RowVectorXd output = dense_weights_ * h2.back();
	output.array() += dense_bias_;
	return output.transpose();
}

double LstmRegressor::predict(const std::vector<double> &window) const {
	if (window.size() != config_.window_size) {
		throw std::invalid_argument("LSTM window has " + std::to_string(window.size()) + " values, expected " +
		                            std::to_string(config_.window_size) + ".");
	}
	Eigen::MatrixXd inputs(1, static_cast<Eigen::Index>(window.size()));
	for (std::size_t t = 0; t < window.size(); ++t) {
		inputs(0, static_cast<Eigen::Index>(t)) = window[t];
	}
	return predictBatch(inputs)(0);
}

double LstmRegressor::loss(const Eigen::MatrixXd &inputs, const Eigen::VectorXd &targets) const {
	if (targets.size() != inputs.rows()) {
		throw std::invalid_argument("LSTM targets must match the batch size.");
	}
	return (predictBatch(inputs) - targets).squaredNorm() / static_cast<double>(targets.size());
}

double LstmRegressor::lossAndGradient(const Eigen::MatrixXd &inputs, const Eigen::VectorXd &targets,
                                      Eigen::VectorXd &gradient, std::mt19937 *dropout_rng) const {
	validateBatch(inputs);
	if (targets.size() != inputs.rows()) {
		throw std::invalid_argument("LSTM targets must match the batch size.");
	}
	const Eigen::Index batch = inputs.rows();
	const bool use_dropout = dropout_rng != nullptr && config_.dropout > 0.0;

	ForwardTrace trace;
	std::vector<Eigen::MatrixXd> steps;
	steps.reserve(static_cast<std::size_t>(inputs.cols()));
	for (Eigen::Index t = 0; t < inputs.cols(); ++t) {
		steps.emplace_back(inputs.col(t).transpose());
	}

	auto h1 = forwardLayer(layer1_, steps, &trace.layer1);
	if (use_dropout) {
		for (auto &h : h1) {
			trace.mask1.push_back(dropoutMask(h.rows(), h.cols(), config_.dropout, *dropout_rng));
			h = (h.array() * trace.mask1.back().array()).matrix();
		}
	}
	const auto h2 = forwardLayer(layer2_, h1, &trace.layer2);
	trace.dense_input = h2.back();
	if (use_dropout) {
		trace.mask2 = dropoutMask(trace.dense_input.rows(), batch, config_.dropout, *dropout_rng);
		trace.dense_input = (trace.dense_input.array() * trace.mask2.array()).matrix();
	}
	trace.output = dense_weights_ * trace.dense_input;
	trace.output.array() += dense_bias_;

	const Eigen::RowVectorXd residual = trace.output - targets.transpose();
	const double loss = residual.squaredNorm() / static_cast<double>(batch);

	// Backward pass.
	const Eigen::RowVectorXd d_output = 2.0 * residual / static_cast<double>(batch);
	LstmLayer grad1 = zeroLayer(layer1_.input_weights.cols(), layer1_.units());
	LstmLayer grad2 = zeroLayer(layer2_.input_weights.cols(), layer2_.units());
	const Eigen::RowVectorXd grad_dense = d_output * trace.dense_input.transpose();
	const double grad_bias = d_output.sum();

	Eigen::MatrixXd d_last = dense_weights_.transpose() * d_output;
	if (use_dropout) {
		d_last = (d_last.array() * trace.mask2.array()).matrix();
	}
	std::vector<Eigen::MatrixXd> d_h2(trace.layer2.size(), Eigen::MatrixXd::Zero(layer2_.units(), batch));
	d_h2.back() = d_last;

	auto d_h1 = backwardLayer(layer2_, trace.layer2, d_h2, grad2);
	if (use_dropout) {
		for (std::size_t t = 0; t < d_h1.size(); ++t) {
			d_h1[t] = (d_h1[t].array() * trace.mask1[t].array()).matrix();
		}
	}
	backwardLayer(layer1_, trace.layer1, d_h1, grad1);

	gradient.resize(static_cast<Eigen::Index>(parameterCount()));
	Eigen::Index offset = 0;
	packLayer(grad1, gradient, offset);
	packLayer(grad2, gradient, offset);
	gradient.segment(offset, grad_dense.size()) = grad_dense.transpose();
	offset += grad_dense.size();
	gradient(offset) = grad_bias;
	return loss;
}

// --- Builder Implementation ---

LstmRegressorBuilder &LstmRegressorBuilder::withWindowSize(std::size_t window_size) {
	config_.window_size = window_size;
	return *this;
}

LstmRegressorBuilder &LstmRegressorBuilder::withUnits(std::size_t units_1, std::size_t units_2) {
	config_.units_1 = units_1;
	config_.units_2 = units_2;
	return *this;
}

LstmRegressorBuilder &LstmRegressorBuilder::withDropout(double dropout) {
	config_.dropout = dropout;
	return *this;
}

LstmRegressorBuilder &LstmRegressorBuilder::withSeed(std::uint32_t seed) {
	seed_ = seed;
	return *this;
}

LstmRegressorBuilder &LstmRegressorBuilder::withConfig(const LstmConfig &config) {
	config_ = config;
	return *this;
}

std::unique_ptr<LstmRegressor> LstmRegressorBuilder::build() {
	std::unique_ptr<LstmRegressor> model(new LstmRegressor(config_));
	model->initialize(seed_);
	GAPFILL_DEBUG("Built LSTM regressor (window={}, units={}/{}, dropout={}, parameters={}).", config_.window_size,
	              config_.units_1, config_.units_2, config_.dropout, model->parameterCount());
	return model;
}

} // namespace gapfill::models
