#pragma once

#include "demand-stats/core/time_series.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace demandstats::detectors {

/**
 * @struct OutlierResult
 * @brief Holds the results of an outlier detection operation.
 */
struct OutlierResult {
	/// One flag per input point (or row), true when the point is an outlier.
	std::vector<bool> flags;
	/// Positions of the flagged points in the original input, ascending.
	std::vector<std::size_t> outlier_indices;
	/// Per-point statistic the decision was made on (|z|, modified z, distance...).
	std::vector<double> scores;
	/// Cut-off applied to the scores; for IQR the distance of the fences from the quartiles.
	double threshold = 0.0;

	std::size_t count() const {
		return outlier_indices.size();
	}

	/// Share of flagged points in percent; 0 for empty input.
	double percentage() const {
		return flags.empty() ? 0.0 : 100.0 * static_cast<double>(count()) / static_cast<double>(flags.size());
	}

	/// Flags point @p index and records it in outlier_indices.
	void markOutlier(std::size_t index) {
		flags[index] = true;
		outlier_indices.push_back(index);
	}
};

/**
 * @class IOutlierDetector
 * @brief An interface for all outlier detection algorithms.
 */
class IOutlierDetector {
public:
	virtual ~IOutlierDetector() = default;

	/**
	 * @brief Detects outliers in the given time series.
	 * @param ts The time series data to analyze. Missing values are never flagged.
	 * @return An OutlierResult with one flag per observation.
	 */
	virtual OutlierResult detect(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Gets the name of the outlier detector.
	 * @return A string representing the detector's name.
	 */
	virtual std::string getName() const = 0;
};

} // namespace demandstats::detectors
