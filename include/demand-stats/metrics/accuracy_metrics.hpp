#pragma once

#include "demand-stats/core/forecast_pair.hpp"

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace demandstats::metrics {

/**
 * @brief Point-forecast accuracy summary.
 *
 * Percentage metrics are expressed in percent. Fields that are undefined for
 * the given data (e.g. MAPE when every actual is zero) hold NaN.
 */
struct AccuracyMetricSet {
	double mape = std::numeric_limits<double>::quiet_NaN();
	double wape = std::numeric_limits<double>::quiet_NaN();
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	double bias = std::numeric_limits<double>::quiet_NaN();
	double smape = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	std::size_t n = 0;

	/// Metric name -> value, keyed "mape", "wape", "mae", "rmse", "bias", "smape", "mse".
	std::map<std::string, double> asMap() const;
};

class AccuracyMetricsEngine final {
public:
	static AccuracyMetricSet compute(const core::ActualForecastPair &pair);
	static AccuracyMetricSet compute(const std::vector<double> &actual, const std::vector<double> &forecast);

	/// Mean absolute percentage error over positions with a non-zero actual.
	static double mape(const std::vector<double> &actual, const std::vector<double> &forecast);
	/// Weighted absolute percentage error, sum|a - f| / sum|a|.
	static double wape(const std::vector<double> &actual, const std::vector<double> &forecast);
	static double mae(const std::vector<double> &actual, const std::vector<double> &forecast);
	static double mse(const std::vector<double> &actual, const std::vector<double> &forecast);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &forecast);
	/// Mean of forecast - actual; positive values mean over-forecasting.
	static double bias(const std::vector<double> &actual, const std::vector<double> &forecast);
	static double smape(const std::vector<double> &actual, const std::vector<double> &forecast);
};

} // namespace demandstats::metrics
