#include "demand-stats/metrics/volatility.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandstats::metrics {

namespace {

constexpr double kCvBaseline = 0.2;
constexpr double kCvCap = 2.0;

double ewmaReturnVolatility(const std::vector<double> &data, double span) {
	if (data.size() < 3) {
		throw std::invalid_argument("EWMA volatility requires at least three observations.");
	}
	if (!(span >= 1.0)) {
		throw std::invalid_argument("EWMA span must be at least 1.");
	}

	std::vector<double> returns(data.size() - 1);
	for (std::size_t i = 1; i < data.size(); ++i) {
		if (data[i - 1] == 0.0) {
			throw std::invalid_argument("EWMA volatility requires non-zero levels to form returns.");
		}
		returns[i - 1] = (data[i] - data[i - 1]) / data[i - 1];
	}

	// Adjusted weights: the newest return has weight 1, older ones decay by (1 - alpha).
	const double alpha = 2.0 / (span + 1.0);
	const std::size_t n = returns.size();
	std::vector<double> weights(n);
	double weight = 1.0;
	for (std::size_t i = n; i-- > 0;) {
		weights[i] = weight;
		weight *= 1.0 - alpha;
	}

	double sum_w = 0.0;
	double sum_w2 = 0.0;
	double weighted_mean = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		sum_w += weights[i];
		sum_w2 += weights[i] * weights[i];
		weighted_mean += weights[i] * returns[i];
	}
	weighted_mean /= sum_w;

	double biased = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double d = returns[i] - weighted_mean;
		biased += weights[i] * d * d;
	}
	biased /= sum_w;

	const double correction = (sum_w * sum_w) / (sum_w * sum_w - sum_w2);
	return std::sqrt(biased * correction);
}

} // namespace

double volatility(const std::vector<double> &data, VolatilityMethod method, double span) {
	if (data.empty()) {
		throw std::invalid_argument("Volatility requires at least one observation.");
	}
	switch (method) {
	case VolatilityMethod::StdDev:
		return utils::Statistics::stddev(data, 0);
	case VolatilityMethod::Ewma:
		return ewmaReturnVolatility(data, span);
	}
	throw std::invalid_argument("Unknown volatility method.");
}

VolatilityMetrics volatilityMetrics(const std::vector<double> &data) {
	VolatilityMetrics metrics;
	if (data.size() < 2) {
		DEMANDSTATS_DEBUG("Volatility metrics need two observations, got {}", data.size());
		return metrics;
	}
	metrics.mean = utils::Statistics::mean(data);
	metrics.variance = utils::Statistics::variance(data, 1);
	metrics.standard_deviation = std::sqrt(metrics.variance);
	metrics.coefficient_of_variation = metrics.mean != 0.0 ? metrics.standard_deviation / metrics.mean : 0.0;
	metrics.volatility_score = std::min(metrics.coefficient_of_variation, kCvCap) / kCvCap;
	metrics.relative_volatility =
	    metrics.coefficient_of_variation > 0.0 ? metrics.coefficient_of_variation / kCvBaseline : 0.0;
	return metrics;
}

} // namespace demandstats::metrics
