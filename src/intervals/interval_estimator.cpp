#include "demand-stats/intervals/interval_estimator.hpp"

#include "demand-stats/utils/distributions.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace demandstats::intervals {

namespace {

void validateLevel(double level) {
	if (!(level > 0.0 && level < 1.0)) {
		throw std::invalid_argument("Confidence level must lie strictly between 0 and 1.");
	}
}

} // namespace

Interval IntervalEstimator::confidenceInterval(const std::vector<double> &data, double level) {
	validateLevel(level);
	if (data.size() < 2) {
		throw std::invalid_argument("Confidence interval requires at least two observations.");
	}
	const double n = static_cast<double>(data.size());
	const double mean = utils::Statistics::mean(data);
	const double sem = utils::Statistics::stddev(data, 1) / std::sqrt(n);
	const double t = utils::Distributions::studentTQuantile((1.0 + level) / 2.0, n - 1.0);
	return Interval {mean - t * sem, mean + t * sem, level};
}

Interval IntervalEstimator::bootstrapConfidenceInterval(const std::vector<double> &data, double level,
                                                        std::size_t n_bootstrap, std::mt19937_64 &engine) {
	validateLevel(level);
	if (data.empty()) {
		throw std::invalid_argument("Bootstrap interval requires at least one observation.");
	}
	if (n_bootstrap == 0) {
		throw std::invalid_argument("Bootstrap interval requires at least one resample.");
	}

	const std::size_t n = data.size();
	std::uniform_int_distribution<std::size_t> pick(0, n - 1);
	std::vector<double> resample_means(n_bootstrap);
	for (std::size_t b = 0; b < n_bootstrap; ++b) {
		double sum = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			sum += data[pick(engine)];
		}
		resample_means[b] = sum / static_cast<double>(n);
	}

	const double alpha = 1.0 - level;
	const double lower = utils::Statistics::percentile(resample_means, alpha / 2.0 * 100.0);
	const double upper = utils::Statistics::percentile(resample_means, (1.0 - alpha / 2.0) * 100.0);
	return Interval {lower, upper, level};
}

Interval IntervalEstimator::bootstrapConfidenceInterval(const std::vector<double> &data, double level,
                                                        std::size_t n_bootstrap, std::uint64_t seed) {
	std::mt19937_64 engine(seed);
	return bootstrapConfidenceInterval(data, level, n_bootstrap, engine);
}

Interval IntervalEstimator::predictionInterval(double forecast, double std_error, double level,
                                               std::optional<int> degrees_of_freedom) {
	validateLevel(level);
	const double p = (1.0 + level) / 2.0;
	const double q = degrees_of_freedom
	                     ? utils::Distributions::studentTQuantile(p, static_cast<double>(*degrees_of_freedom))
	                     : utils::Distributions::normalQuantile(p);
	if (!(std_error >= 0.0)) {
		DEMANDSTATS_WARN("Prediction interval received standard error {}; bounds may be inverted", std_error);
	}
	const double margin = q * std_error;
	return Interval {forecast - margin, forecast + margin, level};
}

std::vector<ForecastIntervalBand> IntervalEstimator::forecastIntervals(const std::vector<double> &point_forecasts,
                                                                       const std::vector<double> &residuals,
                                                                       const std::vector<double> &levels) {
	if (residuals.empty()) {
		throw std::invalid_argument("Forecast intervals require at least one residual.");
	}
	for (double level : levels) {
		validateLevel(level);
	}

	const double std_error = utils::Statistics::stddev(residuals, 0);
	std::vector<ForecastIntervalBand> bands;
	bands.reserve(levels.size());
	for (double level : levels) {
		const double margin = utils::Distributions::normalQuantile((1.0 + level) / 2.0) * std_error;
		ForecastIntervalBand band;
		band.confidence_level = level;
		band.intervals.reserve(point_forecasts.size());
		for (double forecast : point_forecasts) {
			band.intervals.push_back(Interval {forecast - margin, forecast + margin, level});
		}
		bands.push_back(std::move(band));
	}
	return bands;
}

double IntervalEstimator::coverage(const std::vector<double> &actual, const std::vector<Interval> &intervals) {
	if (actual.size() != intervals.size() || actual.empty()) {
		throw std::invalid_argument("Actual values and intervals must be non-empty and equal length.");
	}
	std::size_t covered = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		if (intervals[i].contains(actual[i])) {
			++covered;
		}
	}
	return static_cast<double>(covered) / static_cast<double>(actual.size());
}

} // namespace demandstats::intervals
