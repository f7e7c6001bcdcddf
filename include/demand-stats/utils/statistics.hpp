#pragma once

#include <cstddef>
#include <vector>

namespace demandstats::utils {

/**
 * @brief Descriptive statistics shared by the analysis components.
 *
 * All helpers throw std::invalid_argument on empty input unless stated
 * otherwise. The nan* variants ignore non-finite observations.
 */
namespace Statistics {

double mean(const std::vector<double> &data);

/**
 * @brief Variance with @p ddof delta degrees of freedom (0 = population, 1 = sample).
 * @throws std::invalid_argument If data.size() <= ddof.
 */
double variance(const std::vector<double> &data, std::size_t ddof = 0);

double stddev(const std::vector<double> &data, std::size_t ddof = 0);

/// Population variance over finite values; 0 when fewer than one finite value remains.
double nanVariance(const std::vector<double> &data);

/**
 * @brief Percentile with linear interpolation between closest ranks.
 * @param q Percentile in [0, 100].
 */
double percentile(std::vector<double> data, double q);

double median(std::vector<double> data);

/// Copy of @p data without NaN or infinite values.
std::vector<double> finiteValues(const std::vector<double> &data);

/// First differences x[i] - x[i-1].
std::vector<double> diff(const std::vector<double> &data);

} // namespace Statistics
} // namespace demandstats::utils
