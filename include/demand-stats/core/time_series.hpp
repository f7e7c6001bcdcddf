#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace demandstats::core {

/**
 * @class TimeSeries
 * @brief An ordered sequence of observations with an optional time index.
 *
 * Values are stored contiguously for numerical processing. When timestamps are
 * supplied they must match the number of values and be strictly increasing;
 * otherwise the series carries an implicit regular index 0..n-1. Missing
 * observations are represented by NaN.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a series with an implicit regular index.
	 * @param values The observations in time order.
	 */
	explicit TimeSeries(std::vector<Value> values, std::string label = {})
	    : values_(std::move(values)), label_(std::move(label)) {
	}

	/**
	 * @brief Constructs a series with explicit timestamps.
	 * @throws std::invalid_argument If the sizes of timestamps and values differ or
	 *         the timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string label = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), label_(std::move(label)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	bool hasTimestamps() const {
		return !timestamps_.empty();
	}

	std::size_t size() const {
		return values_.size();
	}

	bool isEmpty() const {
		return values_.empty();
	}

	const std::string &label() const {
		return label_;
	}

	Value operator[](std::size_t index) const {
		return values_[index];
	}

	Value at(std::size_t index) const {
		if (index >= values_.size()) {
			throw std::out_of_range("Requested observation exceeds the time series length.");
		}
		return values_[index];
	}

	bool hasMissingValues() const {
		for (double value : values_) {
			if (!std::isfinite(value)) {
				return true;
			}
		}
		return false;
	}

	/**
	 * @brief Returns a copy without non-finite observations (and their timestamps).
	 */
	TimeSeries dropMissing() const {
		std::vector<Value> kept_values;
		std::vector<TimePoint> kept_timestamps;
		kept_values.reserve(values_.size());
		if (hasTimestamps()) {
			kept_timestamps.reserve(values_.size());
		}
		for (std::size_t i = 0; i < values_.size(); ++i) {
			if (!std::isfinite(values_[i])) {
				continue;
			}
			kept_values.push_back(values_[i]);
			if (hasTimestamps()) {
				kept_timestamps.push_back(timestamps_[i]);
			}
		}
		if (hasTimestamps()) {
			return TimeSeries(std::move(kept_timestamps), std::move(kept_values), label_);
		}
		return TimeSeries(std::move(kept_values), label_);
	}

	/**
	 * @brief Returns the series differenced @p order times.
	 *
	 * Each pass drops the first observation (and its timestamp).
	 */
	TimeSeries differenced(std::size_t order = 1) const {
		if (order >= values_.size()) {
			throw std::invalid_argument("Differencing order must be smaller than the series length.");
		}
		std::vector<Value> current = values_;
		for (std::size_t pass = 0; pass < order; ++pass) {
			std::vector<Value> next(current.size() - 1);
			for (std::size_t i = 1; i < current.size(); ++i) {
				next[i - 1] = current[i] - current[i - 1];
			}
			current = std::move(next);
		}
		if (hasTimestamps()) {
			std::vector<TimePoint> shifted(timestamps_.begin() + static_cast<std::ptrdiff_t>(order), timestamps_.end());
			return TimeSeries(std::move(shifted), std::move(current), label_);
		}
		return TimeSeries(std::move(current), label_);
	}

	/**
	 * @brief Position of each observation on a numeric time axis.
	 *
	 * Seconds elapsed since the first timestamp when timestamps exist, otherwise
	 * the observation index.
	 */
	std::vector<double> timeAxis() const {
		std::vector<double> axis(values_.size());
		if (!hasTimestamps()) {
			for (std::size_t i = 0; i < axis.size(); ++i) {
				axis[i] = static_cast<double>(i);
			}
			return axis;
		}
		const auto origin = timestamps_.front();
		for (std::size_t i = 0; i < axis.size(); ++i) {
			axis[i] = std::chrono::duration<double>(timestamps_[i] - origin).count();
		}
		return axis;
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string label_;
};

} // namespace demandstats::core
