#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace demandstats::core {

/**
 * @class ActualForecastPair
 * @brief Index-aligned actual and forecast observations of equal, non-zero length.
 */
class ActualForecastPair {
public:
	/**
	 * @throws std::invalid_argument If either vector is empty or the lengths differ.
	 */
	ActualForecastPair(std::vector<double> actual, std::vector<double> forecast)
	    : actual_(std::move(actual)), forecast_(std::move(forecast)) {
		if (actual_.empty() || actual_.size() != forecast_.size()) {
			throw std::invalid_argument("Actual and forecast vectors must be non-empty and equal length.");
		}
	}

	const std::vector<double> &actual() const {
		return actual_;
	}

	const std::vector<double> &forecast() const {
		return forecast_;
	}

	std::size_t size() const {
		return actual_.size();
	}

	/// The same observations with the roles of actual and forecast exchanged.
	ActualForecastPair swapped() const {
		return ActualForecastPair(forecast_, actual_);
	}

private:
	std::vector<double> actual_;
	std::vector<double> forecast_;
};

} // namespace demandstats::core
