#include "gapfill/training/windowing.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gapfill::training {

WindowSet WindowSet::slice(std::size_t first, std::size_t count) const {
	if (first + count > size()) {
		throw std::out_of_range("WindowSet slice exceeds the number of windows.");
	}
	WindowSet out;
	const auto row = static_cast<Eigen::Index>(first);
	const auto n = static_cast<Eigen::Index>(count);
	out.inputs = inputs.middleRows(row, n);
	out.targets = targets.segment(row, n);
	out.target_times.assign(target_times.begin() + static_cast<std::ptrdiff_t>(first),
	                        target_times.begin() + static_cast<std::ptrdiff_t>(first + count));
	return out;
}

WindowSet WindowSet::select(const std::vector<std::size_t> &rows) const {
	WindowSet out;
	out.inputs.resize(static_cast<Eigen::Index>(rows.size()), inputs.cols());
	out.targets.resize(static_cast<Eigen::Index>(rows.size()));
	out.target_times.reserve(rows.size());
	for (std::size_t i = 0; i < rows.size(); ++i) {
		if (rows[i] >= size()) {
			throw std::out_of_range("WindowSet row index out of range.");
		}
		const auto src = static_cast<Eigen::Index>(rows[i]);
		const auto dst = static_cast<Eigen::Index>(i);
		out.inputs.row(dst) = inputs.row(src);
		out.targets(dst) = targets(src);
		out.target_times.push_back(target_times[rows[i]]);
	}
	return out;
}

WindowSet buildWindows(const std::vector<core::HourlySeries> &runs, std::size_t window_size) {
	if (window_size == 0) {
		throw std::invalid_argument("Window size must be positive.");
	}

	std::vector<const core::HourlySeries *> usable;
	std::size_t total = 0;
	for (const auto &run : runs) {
		if (run.size() >= window_size + 1) {
			usable.push_back(&run);
			total += run.size() - window_size;
		}
	}
	std::sort(usable.begin(), usable.end(), [](const core::HourlySeries *a, const core::HourlySeries *b) {
		return a->front().timestamp < b->front().timestamp;
	});

	WindowSet windows;
	windows.inputs.resize(static_cast<Eigen::Index>(total), static_cast<Eigen::Index>(window_size));
	windows.targets.resize(static_cast<Eigen::Index>(total));
	windows.target_times.reserve(total);

	Eigen::Index row = 0;
	for (const auto *run : usable) {
		for (std::size_t target = window_size; target < run->size(); ++target) {
			for (std::size_t k = 0; k < window_size; ++k) {
				windows.inputs(row, static_cast<Eigen::Index>(k)) = (*run)[target - window_size + k].value;
			}
			windows.targets(row) = (*run)[target].value;
			windows.target_times.push_back((*run)[target].timestamp);
			++row;
		}
	}
	return windows;
}

ChronologicalSplit splitChronologically(const WindowSet &windows, double validation_fraction) {
	if (!(validation_fraction > 0.0 && validation_fraction < 1.0)) {
		throw std::invalid_argument("Validation fraction must lie in (0, 1).");
	}
	const std::size_t n = windows.size();
	if (n < 2) {
		throw std::invalid_argument("At least two windows are required for a chronological split.");
	}
	auto n_train = static_cast<std::size_t>(std::floor(static_cast<double>(n) * (1.0 - validation_fraction)));
	n_train = std::clamp<std::size_t>(n_train, 1, n - 1);

	ChronologicalSplit split;
	split.training = windows.slice(0, n_train);
	split.validation = windows.slice(n_train, n - n_train);
	return split;
}

} // namespace gapfill::training
