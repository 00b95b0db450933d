#pragma once

#include "gapfill/core/config.hpp"
#include "gapfill/core/gap.hpp"
#include "gapfill/store/reading_store.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gapfill::detect {

/// Readings of one scan, reduced to the hours at which the parameter is present.
struct GapScan {
	std::string station_id;
	core::Parameter parameter = core::Parameter::PM25;
	core::TimePoint first{};
	core::TimePoint last{};
	std::vector<core::TimePoint> present;
	core::GapConfig config;
};

/**
 * @class GapIterator
 * @brief Input iterator producing one classified gap per increment.
 */
class GapIterator {
public:
	using iterator_category = std::input_iterator_tag;
	using value_type = core::Gap;
	using difference_type = std::ptrdiff_t;
	using pointer = const core::Gap *;
	using reference = const core::Gap &;

	GapIterator() = default;
	explicit GapIterator(std::shared_ptr<const GapScan> scan);

	reference operator*() const {
		return current_;
	}
	pointer operator->() const {
		return &current_;
	}
	GapIterator &operator++();
	GapIterator operator++(int);

	bool operator==(const GapIterator &other) const;
	bool operator!=(const GapIterator &other) const {
		return !(*this == other);
	}

private:
	void advance();

	std::shared_ptr<const GapScan> scan_;
	std::size_t index_ = 0;
	core::TimePoint cursor_{};
	core::Gap current_;
	bool done_ = true;
};

/**
 * @class GapSequence
 * @brief Finite, restartable sequence of the gaps in one (station, parameter, range).
 *
 * Each begin() reads the range from the store afresh, so a store failure
 * surfaces before any gap is produced and a restarted iteration sees current data.
 */
class GapSequence {
public:
	GapSequence(std::shared_ptr<const store::ReadingStore> store, std::string station_id, core::Parameter parameter,
	            core::TimePoint first, core::TimePoint last, core::GapConfig config, bool imputed_counts_as_missing);

	/// @throws core::StoreUnavailable when the readings cannot be read.
	GapIterator begin() const;
	GapIterator end() const {
		return GapIterator();
	}

	std::vector<core::Gap> toVector() const;

private:
	std::shared_ptr<const store::ReadingStore> store_;
	std::string station_id_;
	core::Parameter parameter_;
	core::TimePoint first_;
	core::TimePoint last_;
	core::GapConfig config_;
	bool imputed_counts_as_missing_;
};

/**
 * @class GapDetector
 * @brief Finds maximal runs of missing hours and classifies them by duration.
 *
 * Hours without a row and rows with a null value are both missing. The scan
 * covers every whole hour in [start, end].
 */
class GapDetector {
public:
	GapDetector(std::shared_ptr<const store::ReadingStore> store, core::GapConfig config = {});

	/**
	 * @param imputed_counts_as_missing When true, imputed values are treated as gaps
	 *        (the view of the sensor record itself).
	 * @throws std::invalid_argument for an unknown station or end < start.
	 * @throws core::StoreUnavailable when the station lookup fails.
	 */
	GapSequence detect(const std::string &station_id, core::Parameter parameter, core::TimePoint start,
	                   core::TimePoint end, bool imputed_counts_as_missing = false) const;

	/// The gap containing @p timestamp, if that hour is missing.
	std::optional<core::Gap> gapAt(const std::string &station_id, core::Parameter parameter,
	                               core::TimePoint timestamp, bool imputed_counts_as_missing = false) const;

	const core::GapConfig &config() const noexcept {
		return config_;
	}

private:
	std::shared_ptr<const store::ReadingStore> store_;
	core::GapConfig config_;
};

} // namespace gapfill::detect
