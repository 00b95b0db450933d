#include "gapfill/detect/gap_detector.hpp"

#include "gapfill/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace gapfill::detect {

namespace {

core::TimePoint ceilToHour(core::TimePoint tp) {
	const auto floored = core::floorToHour(tp);
	return floored < tp ? floored + core::kOneHour : floored;
}

} // namespace

GapIterator::GapIterator(std::shared_ptr<const GapScan> scan) : scan_(std::move(scan)) {
	cursor_ = scan_->first;
	done_ = false;
	advance();
}

GapIterator &GapIterator::operator++() {
	advance();
	return *this;
}

GapIterator GapIterator::operator++(int) {
	GapIterator previous = *this;
	advance();
	return previous;
}

bool GapIterator::operator==(const GapIterator &other) const {
	if (done_ || other.done_) {
		return done_ == other.done_;
	}
	return scan_ == other.scan_ && current_.start == other.current_.start;
}

void GapIterator::advance() {
	const auto &present = scan_->present;
	const auto isPresent = [&](core::TimePoint hour) {
		while (index_ < present.size() && present[index_] < hour) {
			++index_;
		}
		return index_ < present.size() && present[index_] == hour;
	};

	while (cursor_ <= scan_->last && isPresent(cursor_)) {
		cursor_ += core::kOneHour;
	}
	if (cursor_ > scan_->last) {
		done_ = true;
		return;
	}

	const auto gap_start = cursor_;
	while (cursor_ <= scan_->last && !isPresent(cursor_)) {
		cursor_ += core::kOneHour;
	}

	current_.station_id = scan_->station_id;
	current_.parameter = scan_->parameter;
	current_.start = gap_start;
	current_.end = cursor_ - core::kOneHour;
	current_.duration_class = core::classifyGap(current_.hours(), scan_->config);
}

GapSequence::GapSequence(std::shared_ptr<const store::ReadingStore> store, std::string station_id,
                         core::Parameter parameter, core::TimePoint first, core::TimePoint last,
                         core::GapConfig config, bool imputed_counts_as_missing)
    : store_(std::move(store)), station_id_(std::move(station_id)), parameter_(parameter), first_(first),
      last_(last), config_(config), imputed_counts_as_missing_(imputed_counts_as_missing) {
}

GapIterator GapSequence::begin() const {
	if (last_ < first_) {
		return GapIterator();
	}

	auto scan = std::make_shared<GapScan>();
	scan->station_id = station_id_;
	scan->parameter = parameter_;
	scan->first = first_;
	scan->last = last_;
	scan->config = config_;

	const auto readings = store_->getReadings(station_id_, first_, last_);
	for (const auto &reading : readings) {
		const auto value = reading.value(parameter_);
		if (!value || !std::isfinite(*value)) {
			continue;
		}
		if (imputed_counts_as_missing_ && reading.isImputed(parameter_)) {
			continue;
		}
		scan->present.push_back(reading.timestamp);
	}
	std::sort(scan->present.begin(), scan->present.end());
	return GapIterator(std::move(scan));
}

std::vector<core::Gap> GapSequence::toVector() const {
	return std::vector<core::Gap>(begin(), end());
}

GapDetector::GapDetector(std::shared_ptr<const store::ReadingStore> store, core::GapConfig config)
    : store_(std::move(store)), config_(config) {
	if (!store_) {
		throw std::invalid_argument("GapDetector requires a reading store.");
	}
	config_.validate();
}

GapSequence GapDetector::detect(const std::string &station_id, core::Parameter parameter, core::TimePoint start,
                                core::TimePoint end, bool imputed_counts_as_missing) const {
	if (end < start) {
		throw std::invalid_argument("Gap detection range must not end before it starts.");
	}
	if (!store_->stationExists(station_id)) {
		throw std::invalid_argument("Unknown station: " + station_id);
	}
	return GapSequence(store_, station_id, parameter, ceilToHour(start), core::floorToHour(end), config_,
	                   imputed_counts_as_missing);
}

std::optional<core::Gap> GapDetector::gapAt(const std::string &station_id, core::Parameter parameter,
                                            core::TimePoint timestamp, bool imputed_counts_as_missing) const {
	if (!core::isHourAligned(timestamp)) {
		throw std::invalid_argument("Gap lookup requires an hour-aligned timestamp.");
	}
	if (!store_->stationExists(station_id)) {
		throw std::invalid_argument("Unknown station: " + station_id);
	}

	// Far enough to tell a long gap from a medium one; clipped to the recorded history.
	const auto reach = core::Hours(config_.medium_gap_max_h + 1);
	auto first = timestamp - reach;
	auto last = timestamp + reach;
	if (const auto bounds = store_->timeBounds(station_id)) {
		first = std::max(first, std::min(core::floorToHour(bounds->start), timestamp));
		last = std::min(last, std::max(core::floorToHour(bounds->end), timestamp));
	} else {
		first = timestamp;
		last = timestamp;
	}

	GapSequence sequence(store_, station_id, parameter, first, last, config_, imputed_counts_as_missing);
	for (const auto &gap : sequence) {
		if (gap.contains(timestamp)) {
			return gap;
		}
		if (gap.start > timestamp) {
			break;
		}
	}
	return std::nullopt;
}

} // namespace gapfill::detect
