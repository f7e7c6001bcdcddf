#pragma once

#include "demand-stats/core/time_series.hpp"

#include <string>
#include <vector>

namespace demandstats::analysis {

enum class TrendDirection { Increasing, Decreasing, Stable, InsufficientData };

std::string toString(TrendDirection direction);

struct TrendReport {
	bool has_trend = false;
	TrendDirection direction = TrendDirection::InsufficientData;
	/// Change per time unit: per observation, or per second when the series has timestamps.
	double slope = 0.0;
	double intercept = 0.0;
	double r_squared = 0.0;
	double t_statistic = 0.0;
	double p_value = 1.0;
};

/**
 * @class TrendAnalyzer
 * @brief Linear trend significance via least squares on the time axis.
 */
class TrendAnalyzer {
public:
	explicit TrendAnalyzer(double significance = 0.05);

	/// Fewer than three finite observations report InsufficientData.
	TrendReport analyze(const core::TimeSeries &series) const;
	TrendReport analyze(const std::vector<double> &values) const;

private:
	TrendReport fit(const std::vector<double> &x, const std::vector<double> &y) const;

	double significance_;
};

} // namespace demandstats::analysis
