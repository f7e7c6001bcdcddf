#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace demandstats::intervals {

struct Interval {
	double lower = 0.0;
	double upper = 0.0;
	double confidence_level = 0.0;

	double width() const {
		return upper - lower;
	}

	bool contains(double value) const {
		return value >= lower && value <= upper;
	}
};

/// Prediction intervals at one confidence level, one per point forecast.
struct ForecastIntervalBand {
	double confidence_level = 0.0;
	std::vector<Interval> intervals;
};

/**
 * @class IntervalEstimator
 * @brief Confidence intervals for a mean and prediction intervals for forecasts.
 *
 * Every confidence level must lie strictly between 0 and 1.
 */
class IntervalEstimator final {
public:
	static constexpr std::size_t kDefaultBootstrapSamples = 1000;

	/**
	 * @brief Student-t interval for the mean: mean +/- t * s / sqrt(n).
	 * @throws std::invalid_argument If data has fewer than two values or the level is invalid.
	 */
	static Interval confidenceInterval(const std::vector<double> &data, double level = 0.95);

	/**
	 * @brief Percentile bootstrap interval for the mean.
	 *
	 * Draws @p n_bootstrap resamples of size n with replacement from @p engine.
	 * The same engine state always reproduces the same interval.
	 *
	 * @throws std::invalid_argument On empty data, n_bootstrap == 0 or an invalid level.
	 */
	static Interval bootstrapConfidenceInterval(const std::vector<double> &data, double level,
	                                            std::size_t n_bootstrap, std::mt19937_64 &engine);

	/// Seeded convenience overload.
	static Interval bootstrapConfidenceInterval(const std::vector<double> &data, double level = 0.95,
	                                            std::size_t n_bootstrap = kDefaultBootstrapSamples,
	                                            std::uint64_t seed = std::mt19937_64::default_seed);

	/**
	 * @brief forecast +/- q * std_error with q from the normal distribution, or from
	 *        Student-t when @p degrees_of_freedom is given.
	 * @throws std::invalid_argument On an invalid level or degrees of freedom < 1.
	 */
	static Interval predictionInterval(double forecast, double std_error, double level = 0.95,
	                                   std::optional<int> degrees_of_freedom = std::nullopt);

	/**
	 * @brief Normal prediction bands around @p point_forecasts using the population
	 *        standard deviation of historical @p residuals as the standard error.
	 * @return One band per level, in the order given.
	 */
	static std::vector<ForecastIntervalBand> forecastIntervals(const std::vector<double> &point_forecasts,
	                                                           const std::vector<double> &residuals,
	                                                           const std::vector<double> &levels = {0.5, 0.8,
	                                                                                                0.95});

	/// Fraction of @p actual values that fall inside their interval.
	static double coverage(const std::vector<double> &actual, const std::vector<Interval> &intervals);
};

} // namespace demandstats::intervals
