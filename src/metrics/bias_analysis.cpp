#include "demand-stats/metrics/bias_analysis.hpp"

#include "demand-stats/utils/distributions.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>

namespace demandstats::metrics {

using utils::Statistics::mean;

std::string toString(BiasDirection direction) {
	switch (direction) {
	case BiasDirection::Over:
		return "over";
	case BiasDirection::Under:
		return "under";
	case BiasDirection::Neutral:
		return "neutral";
	}
	return "neutral";
}

BiasReport ForecastBiasAnalyzer::analyze(const std::vector<double> &forecast, const std::vector<double> &actual,
                                         double significance) {
	if (forecast.size() != actual.size() || forecast.empty()) {
		throw std::invalid_argument("Forecasts and actuals must have the same non-zero length.");
	}
	if (!(significance > 0.0 && significance < 1.0)) {
		throw std::invalid_argument("Bias significance level must lie strictly between 0 and 1.");
	}

	std::vector<double> errors;
	std::vector<double> kept_actuals;
	errors.reserve(forecast.size());
	kept_actuals.reserve(forecast.size());
	for (std::size_t i = 0; i < forecast.size(); ++i) {
		if (std::isnan(forecast[i]) || std::isnan(actual[i])) {
			continue;
		}
		errors.push_back(forecast[i] - actual[i]);
		kept_actuals.push_back(actual[i]);
	}
	if (errors.empty()) {
		throw std::invalid_argument("No valid forecast/actual pairs remain after removing NaN values.");
	}
	if (errors.size() < forecast.size()) {
		DEMANDSTATS_DEBUG("Bias analysis dropped {} incomplete pairs", forecast.size() - errors.size());
	}

	BiasReport report;
	report.sample_size = errors.size();
	report.mean_bias = mean(errors);
	report.median_bias = utils::Statistics::median(errors);

	double abs_error_sum = 0.0;
	double pct_sum = 0.0;
	double abs_pct_sum = 0.0;
	std::size_t pct_count = 0;
	double abs_actual_sum = 0.0;
	double weighted_error_sum = 0.0;
	for (std::size_t i = 0; i < errors.size(); ++i) {
		abs_error_sum += std::abs(errors[i]);
		abs_actual_sum += std::abs(kept_actuals[i]);
		weighted_error_sum += std::abs(kept_actuals[i]) * errors[i];
		if (kept_actuals[i] != 0.0) {
			const double pct = errors[i] / kept_actuals[i] * 100.0;
			pct_sum += pct;
			abs_pct_sum += std::abs(pct);
			++pct_count;
		}
	}
	const double n = static_cast<double>(errors.size());
	report.mean_absolute_error = abs_error_sum / n;
	if (pct_count > 0) {
		report.mean_percentage_error = pct_sum / static_cast<double>(pct_count);
		report.mean_absolute_percentage_error = abs_pct_sum / static_cast<double>(pct_count);
	}
	if (abs_actual_sum > 0.0) {
		report.weighted_bias = weighted_error_sum / abs_actual_sum;
	}

	if (report.mean_bias > 0.0) {
		report.direction = BiasDirection::Over;
	} else if (report.mean_bias < 0.0) {
		report.direction = BiasDirection::Under;
	}

	report.bias_consistency = utils::Statistics::stddev(errors, 0);

	if (errors.size() < 2) {
		DEMANDSTATS_DEBUG("Bias t-test needs at least two errors; reporting no systematic bias");
		report.t_statistic = std::numeric_limits<double>::quiet_NaN();
		report.p_value = std::numeric_limits<double>::quiet_NaN();
		return report;
	}

	const double sample_sd = utils::Statistics::stddev(errors, 1);
	if (sample_sd == 0.0) {
		if (report.mean_bias == 0.0) {
			report.t_statistic = 0.0;
			report.p_value = 1.0;
		} else {
			report.t_statistic = std::copysign(std::numeric_limits<double>::infinity(), report.mean_bias);
			report.p_value = 0.0;
		}
	} else {
		report.t_statistic = report.mean_bias / (sample_sd / std::sqrt(n));
		report.p_value = utils::Distributions::studentTTwoSidedPValue(report.t_statistic, n - 1.0);
	}
	report.is_systematic = report.p_value < significance;
	return report;
}

} // namespace demandstats::metrics
