#include "demand-stats/metrics/accuracy_metrics.hpp"

#include "demand-stats/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace demandstats::metrics {

namespace {

void validateLengths(const std::vector<double> &actual, const std::vector<double> &forecast) {
	if (actual.size() != forecast.size() || actual.empty()) {
		throw std::invalid_argument("Actual and forecast vectors must be non-empty and equal length.");
	}
}

} // namespace

std::map<std::string, double> AccuracyMetricSet::asMap() const {
	return {{"mape", mape}, {"wape", wape}, {"mae", mae},   {"rmse", rmse},
	        {"bias", bias}, {"smape", smape}, {"mse", mse}};
}

AccuracyMetricSet AccuracyMetricsEngine::compute(const core::ActualForecastPair &pair) {
	return compute(pair.actual(), pair.forecast());
}

AccuracyMetricSet AccuracyMetricsEngine::compute(const std::vector<double> &actual,
                                                 const std::vector<double> &forecast) {
	validateLengths(actual, forecast);

	AccuracyMetricSet result;
	result.n = actual.size();
	result.mape = mape(actual, forecast);
	result.wape = wape(actual, forecast);
	result.mae = mae(actual, forecast);
	result.mse = mse(actual, forecast);
	result.rmse = std::sqrt(result.mse);
	result.bias = bias(actual, forecast);
	result.smape = smape(actual, forecast);

	DEMANDSTATS_DEBUG("Accuracy over {} points: mae={:.4f} rmse={:.4f} bias={:.4f}", result.n, result.mae,
	                  result.rmse, result.bias);
	return result;
}

double AccuracyMetricsEngine::mape(const std::vector<double> &actual, const std::vector<double> &forecast) {
	validateLengths(actual, forecast);
	double sum = 0.0;
	std::size_t count = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		if (actual[i] != 0.0) {
			sum += std::abs(actual[i] - forecast[i]) / std::abs(actual[i]);
			++count;
		}
	}
	if (count == 0) {
		DEMANDSTATS_DEBUG("MAPE undefined: every actual value is zero");
		return std::numeric_limits<double>::quiet_NaN();
	}
	return sum / static_cast<double>(count) * 100.0;
}

double AccuracyMetricsEngine::wape(const std::vector<double> &actual, const std::vector<double> &forecast) {
	validateLengths(actual, forecast);
	double abs_error = 0.0;
	double abs_actual = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		abs_error += std::abs(actual[i] - forecast[i]);
		abs_actual += std::abs(actual[i]);
	}
	if (abs_actual == 0.0) {
		DEMANDSTATS_DEBUG("WAPE undefined: sum of absolute actuals is zero");
		return std::numeric_limits<double>::quiet_NaN();
	}
	return abs_error / abs_actual * 100.0;
}

double AccuracyMetricsEngine::mae(const std::vector<double> &actual, const std::vector<double> &forecast) {
	validateLengths(actual, forecast);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - forecast[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double AccuracyMetricsEngine::mse(const std::vector<double> &actual, const std::vector<double> &forecast) {
	validateLengths(actual, forecast);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - forecast[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double AccuracyMetricsEngine::rmse(const std::vector<double> &actual, const std::vector<double> &forecast) {
	return std::sqrt(mse(actual, forecast));
}

double AccuracyMetricsEngine::bias(const std::vector<double> &actual, const std::vector<double> &forecast) {
	validateLengths(actual, forecast);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += forecast[i] - actual[i];
	}
	return sum / static_cast<double>(actual.size());
}

double AccuracyMetricsEngine::smape(const std::vector<double> &actual, const std::vector<double> &forecast) {
	validateLengths(actual, forecast);
	double sum = 0.0;
	std::size_t count = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double denom = (std::abs(actual[i]) + std::abs(forecast[i])) / 2.0;
		if (denom != 0.0) {
			sum += std::abs(actual[i] - forecast[i]) / denom;
			++count;
		}
	}
	if (count == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return sum / static_cast<double>(count) * 100.0;
}

} // namespace demandstats::metrics
