#pragma once

namespace demandstats::utils {

/**
 * @brief Quantiles and distribution functions of the reference distributions
 * used by the hypothesis tests and interval estimators.
 *
 * Thin wrappers over Boost.Math that validate arguments with
 * std::invalid_argument instead of Boost's domain_error policy.
 */
namespace Distributions {

/// Standard normal quantile for probability p in (0, 1).
double normalQuantile(double p);

double normalCdf(double x);

/// Student-t quantile for probability p in (0, 1) and degrees of freedom >= 1.
double studentTQuantile(double p, double degrees_of_freedom);

double studentTCdf(double t, double degrees_of_freedom);

/// Two-sided p-value 2 * P(T > |t|). Infinite |t| gives 0, NaN gives NaN.
double studentTTwoSidedPValue(double t, double degrees_of_freedom);

/// Two-sided p-value 2 * P(Z > |z|).
double normalTwoSidedPValue(double z);

} // namespace Distributions
} // namespace demandstats::utils
