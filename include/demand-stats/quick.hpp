#pragma once

#include "demand-stats/analysis/sample_comparison.hpp"
#include "demand-stats/analysis/trend.hpp"
#include "demand-stats/core/forecast_pair.hpp"
#include "demand-stats/core/time_series.hpp"
#include "demand-stats/detectors/iqr.hpp"
#include "demand-stats/detectors/mad.hpp"
#include "demand-stats/detectors/mahalanobis.hpp"
#include "demand-stats/detectors/zscore.hpp"
#include "demand-stats/intervals/interval_estimator.hpp"
#include "demand-stats/metrics/accuracy_metrics.hpp"
#include "demand-stats/metrics/bias_analysis.hpp"
#include "demand-stats/metrics/information_criteria.hpp"
#include "demand-stats/metrics/volatility.hpp"
#include "demand-stats/seasonality/decomposition.hpp"
#include "demand-stats/seasonality/periodicity.hpp"
#include "demand-stats/seasonality/spectral.hpp"
#include "demand-stats/stationarity/tester.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace demandstats::quick {

// --- Internal Helpers ---
namespace internal {
inline core::TimeSeries series_from_vector(const std::vector<double> &data) {
	if (data.empty()) {
		throw std::invalid_argument("Input series must contain at least one observation.");
	}
	return core::TimeSeries(data);
}
} // namespace internal

// --- Forecast accuracy ---

inline metrics::AccuracyMetricSet accuracyMetrics(const std::vector<double> &actual,
                                                  const std::vector<double> &forecast) {
	return metrics::AccuracyMetricsEngine::compute(core::ActualForecastPair(actual, forecast));
}

inline metrics::BiasReport forecastBias(const std::vector<double> &forecast, const std::vector<double> &actual) {
	return metrics::ForecastBiasAnalyzer::analyze(forecast, actual);
}

inline double volatility(const std::vector<double> &data,
                         metrics::VolatilityMethod method = metrics::VolatilityMethod::StdDev) {
	return metrics::volatility(data, method);
}

inline metrics::VolatilityMetrics volatilityMetrics(const std::vector<double> &data) {
	return metrics::volatilityMetrics(data);
}

inline metrics::InformationCriteria informationCriteria(const std::vector<double> &residuals, std::size_t n_params) {
	return metrics::informationCriteria(residuals, n_params);
}

// --- Intervals ---

inline intervals::Interval confidenceInterval(const std::vector<double> &data, double level = 0.95) {
	return intervals::IntervalEstimator::confidenceInterval(data, level);
}

inline intervals::Interval bootstrapConfidenceInterval(const std::vector<double> &data, double level = 0.95,
                                                       std::size_t n_bootstrap = 1000,
                                                       std::uint64_t seed = std::mt19937_64::default_seed) {
	return intervals::IntervalEstimator::bootstrapConfidenceInterval(data, level, n_bootstrap, seed);
}

inline intervals::Interval predictionInterval(double forecast, double std_error, double level = 0.95,
                                              std::optional<int> degrees_of_freedom = std::nullopt) {
	return intervals::IntervalEstimator::predictionInterval(forecast, std_error, level, degrees_of_freedom);
}

inline std::vector<intervals::ForecastIntervalBand> forecastIntervals(const std::vector<double> &point_forecasts,
                                                                      const std::vector<double> &residuals,
                                                                      const std::vector<double> &levels = {0.5, 0.8,
                                                                                                           0.95}) {
	return intervals::IntervalEstimator::forecastIntervals(point_forecasts, residuals, levels);
}

// --- Outliers ---

inline detectors::OutlierResult detectOutliersZScore(const std::vector<double> &data, double threshold = 3.0) {
	auto ts = internal::series_from_vector(data);
	auto detector = detectors::ZScoreDetectorBuilder().withThreshold(threshold).build();
	return detector->detect(ts);
}

inline detectors::OutlierResult detectOutliersIQR(const std::vector<double> &data, double k = 1.5) {
	auto ts = internal::series_from_vector(data);
	auto detector = detectors::IQRDetectorBuilder().withMultiplier(k).build();
	return detector->detect(ts);
}

inline detectors::OutlierResult detectOutliersMAD(const std::vector<double> &data, double threshold = 3.5) {
	auto ts = internal::series_from_vector(data);
	auto detector = detectors::MADDetectorBuilder().withThreshold(threshold).build();
	return detector->detect(ts);
}

inline detectors::OutlierResult detectOutliersDistance(const std::vector<std::vector<double>> &points,
                                                       double contamination = 0.1) {
	auto detector = detectors::MahalanobisDetectorBuilder().withContamination(contamination).build();
	return detector->detect(points);
}

inline detectors::OutlierResult detectOutliersDistance(const std::vector<double> &data, double contamination = 0.1) {
	auto ts = internal::series_from_vector(data);
	auto detector = detectors::MahalanobisDetectorBuilder().withContamination(contamination).build();
	return detector->detect(ts);
}

// --- Seasonality ---

inline std::size_t estimateSeasonalPeriod(const std::vector<double> &data) {
	return seasonality::PeriodicityEstimator::builder().build().estimate(data);
}

inline seasonality::SpectralSeasonality detectSeasonality(const std::vector<double> &data, double min_strength = 0.3) {
	return seasonality::SpectralSeasonalityDetector::builder().minStrength(min_strength).build().detect(data);
}

inline seasonality::DecompositionResult decompose(
    const std::vector<double> &data, seasonality::DecompositionModel model = seasonality::DecompositionModel::Additive,
    std::optional<std::size_t> period = std::nullopt) {
	auto builder = seasonality::SeasonalDecomposer::builder();
	builder.withModel(model);
	if (period) {
		builder.withPeriod(*period);
	}
	return builder.build().decompose(data);
}

// --- Stationarity and trend ---

inline stationarity::StationarityVerdict testStationarity(const std::vector<double> &data) {
	return stationarity::StationarityTester::builder().build().test(data);
}

inline stationarity::DifferencingRecommendation recommendDifferencing(const std::vector<double> &data,
                                                                      std::size_t max_order = 2) {
	return stationarity::StationarityTester::builder().build().recommendDifferencing(data, max_order);
}

inline analysis::TrendReport analyzeTrend(const std::vector<double> &data) {
	return analysis::TrendAnalyzer().analyze(data);
}

inline analysis::ComparisonResult compareSamples(const std::vector<double> &sample1,
                                                 const std::vector<double> &sample2,
                                                 analysis::ComparisonTest test = analysis::ComparisonTest::StudentT) {
	return analysis::SampleComparison::compare(sample1, sample2, test);
}

} // namespace demandstats::quick
