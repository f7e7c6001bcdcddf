#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace demandstats::metrics {

enum class BiasDirection { Over, Under, Neutral };

std::string toString(BiasDirection direction);

/**
 * @brief Systematic-error profile of a forecast. Errors are forecast - actual.
 */
struct BiasReport {
	double mean_bias = 0.0;
	double median_bias = 0.0;
	double mean_absolute_error = 0.0;
	double mean_percentage_error = std::numeric_limits<double>::quiet_NaN();
	double mean_absolute_percentage_error = std::numeric_limits<double>::quiet_NaN();
	double weighted_bias = std::numeric_limits<double>::quiet_NaN();
	BiasDirection direction = BiasDirection::Neutral;
	double t_statistic = 0.0;
	double p_value = 1.0;
	bool is_systematic = false;
	/// Population standard deviation of the errors; lower is more consistent.
	double bias_consistency = 0.0;
	std::size_t sample_size = 0;
};

class ForecastBiasAnalyzer final {
public:
	/**
	 * @brief Analyses forecast errors after dropping positions where either value is NaN.
	 * @throws std::invalid_argument On empty or unequal inputs, or when no complete pair remains.
	 */
	static BiasReport analyze(const std::vector<double> &forecast, const std::vector<double> &actual,
	                          double significance = 0.05);
};

} // namespace demandstats::metrics
