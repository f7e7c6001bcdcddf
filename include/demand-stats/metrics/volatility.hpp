#pragma once

#include <vector>

namespace demandstats::metrics {

enum class VolatilityMethod { StdDev, Ewma };

/**
 * @brief Volatility of a level series.
 *
 * StdDev is the population standard deviation of the levels. Ewma is the square
 * root of the bias-corrected exponentially weighted variance of simple returns
 * (span @p span, adjusted weights) at the last observation.
 *
 * @throws std::invalid_argument On empty input; for Ewma also on fewer than three
 *         observations, a zero level, or span < 1.
 */
double volatility(const std::vector<double> &data, VolatilityMethod method = VolatilityMethod::StdDev,
                  double span = 20.0);

struct VolatilityMetrics {
	double mean = 0.0;
	double standard_deviation = 0.0;
	double variance = 0.0;
	double coefficient_of_variation = 0.0;
	/// min(cv, 2) / 2, a [0, 1] score.
	double volatility_score = 0.0;
	/// cv relative to a 20% business baseline.
	double relative_volatility = 0.0;
};

/// Sample-based volatility summary. Fewer than two observations yield all zeros.
VolatilityMetrics volatilityMetrics(const std::vector<double> &data);

} // namespace demandstats::metrics
