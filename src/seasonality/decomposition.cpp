#include "demand-stats/seasonality/decomposition.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {

using demandstats::utils::Statistics::nanVariance;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Centred moving average: p weights for odd p, p + 1 weights with halved ends for even p.
std::vector<double> centredMovingAverage(const std::vector<double>& data, std::size_t period) {
    std::vector<double> weights;
    if (period % 2 == 0) {
        weights.assign(period + 1, 1.0 / static_cast<double>(period));
        weights.front() *= 0.5;
        weights.back() *= 0.5;
    } else {
        weights.assign(period, 1.0 / static_cast<double>(period));
    }
    const std::size_t half = weights.size() / 2;
    const std::size_t n = data.size();

    std::vector<double> trend(n, kNaN);
    for (std::size_t i = half; i + half < n; ++i) {
        double sum = 0.0;
        for (std::size_t j = 0; j < weights.size(); ++j) {
            sum += weights[j] * data[i - half + j];
        }
        trend[i] = sum;
    }
    return trend;
}

double clampUnit(double value) {
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

namespace demandstats::seasonality {

std::string toString(DecompositionModel model) {
    return model == DecompositionModel::Multiplicative ? "multiplicative" : "additive";
}

SeasonalDecomposer::SeasonalDecomposer(DecompositionModel model, std::optional<std::size_t> period,
                                       PeriodicityEstimator estimator)
    : model_(model), period_(period), estimator_(std::move(estimator)) {}

SeasonalDecomposer::Builder& SeasonalDecomposer::Builder::withModel(DecompositionModel model) {
    model_ = model;
    return *this;
}

SeasonalDecomposer::Builder& SeasonalDecomposer::Builder::withPeriod(std::size_t period) {
    period_ = period;
    return *this;
}

SeasonalDecomposer::Builder& SeasonalDecomposer::Builder::withPeriodicityEstimator(
    const PeriodicityEstimator& estimator) {
    estimator_ = estimator;
    return *this;
}

SeasonalDecomposer SeasonalDecomposer::Builder::build() const {
    if (period_ && *period_ < 2) {
        throw std::invalid_argument("Seasonal decomposition requires a period of at least 2.");
    }
    return SeasonalDecomposer(model_, period_, estimator_);
}

SeasonalDecomposer::Builder SeasonalDecomposer::builder() {
    return Builder();
}

double SeasonalDecomposer::seasonalStrength(const std::vector<double>& seasonal,
                                            const std::vector<double>& residual) {
    const double var_resid = nanVariance(residual);
    const double denom = nanVariance(seasonal) + var_resid;
    if (denom <= 0.0) {
        return 0.0;
    }
    return clampUnit(1.0 - var_resid / denom);
}

double SeasonalDecomposer::trendStrength(const std::vector<double>& trend, const std::vector<double>& residual) {
    if (trend.size() != residual.size()) {
        throw std::invalid_argument("Trend and residual components must have the same length.");
    }
    std::vector<double> deseasonalised(trend.size());
    for (std::size_t i = 0; i < trend.size(); ++i) {
        deseasonalised[i] = trend[i] + residual[i];
    }
    const double denom = nanVariance(deseasonalised);
    if (denom <= 0.0) {
        return 0.0;
    }
    return clampUnit(1.0 - nanVariance(residual) / denom);
}

DecompositionResult SeasonalDecomposer::decompose(const core::TimeSeries& series) const {
    return decompose(series.getValues());
}

DecompositionResult SeasonalDecomposer::decompose(const std::vector<double>& data) const {
    if (data.empty()) {
        throw std::invalid_argument("Seasonal decomposition requires a non-empty series.");
    }
    if (std::any_of(data.begin(), data.end(), [](double v) { return !std::isfinite(v); })) {
        throw std::invalid_argument("Seasonal decomposition does not accept missing values.");
    }
    const bool multiplicative = model_ == DecompositionModel::Multiplicative;
    if (multiplicative && std::any_of(data.begin(), data.end(), [](double v) { return v <= 0.0; })) {
        throw std::invalid_argument("Multiplicative decomposition requires strictly positive values.");
    }

    DecompositionResult result;
    result.model = model_;
    result.period_estimated = !period_.has_value();
    result.period = period_ ? *period_ : estimator_.estimate(data);
    const std::size_t p = result.period;
    const std::size_t n = data.size();
    if (n < 2 * p) {
        throw std::invalid_argument("Seasonal decomposition requires at least two full periods (" +
                                    std::to_string(2 * p) + " observations), got " + std::to_string(n) + ".");
    }

    result.observed = data;
    result.trend = centredMovingAverage(data, p);

    std::vector<double> detrended(n);
    for (std::size_t i = 0; i < n; ++i) {
        detrended[i] = multiplicative ? data[i] / result.trend[i] : data[i] - result.trend[i];
    }

    std::vector<double> phase_means(p, 0.0);
    for (std::size_t phase = 0; phase < p; ++phase) {
        double sum = 0.0;
        std::size_t count = 0;
        for (std::size_t i = phase; i < n; i += p) {
            if (std::isfinite(detrended[i])) {
                sum += detrended[i];
                ++count;
            }
        }
        phase_means[phase] = count > 0 ? sum / static_cast<double>(count) : (multiplicative ? 1.0 : 0.0);
    }
    const double overall = utils::Statistics::mean(phase_means);
    for (auto& value : phase_means) {
        value = multiplicative ? value / overall : value - overall;
    }

    result.seasonal.resize(n);
    result.residual.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.seasonal[i] = phase_means[i % p];
        result.residual[i] = multiplicative ? detrended[i] / result.seasonal[i] : detrended[i] - result.seasonal[i];
    }

    result.seasonal_strength = seasonalStrength(result.seasonal, result.residual);
    result.trend_strength = trendStrength(result.trend, result.residual);

    std::vector<double> defined_observed;
    std::vector<double> misfit;
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(result.trend[i])) {
            continue;
        }
        const double fitted = multiplicative ? result.trend[i] * result.seasonal[i]
                                             : result.trend[i] + result.seasonal[i];
        defined_observed.push_back(data[i]);
        misfit.push_back(data[i] - fitted);
    }
    const double observed_variance = nanVariance(defined_observed);
    if (observed_variance > 0.0) {
        result.noise_ratio = clampUnit(nanVariance(misfit) / observed_variance);
    } else {
        DEMANDSTATS_DEBUG("Observed series has no variance; noise ratio set to 0");
        result.noise_ratio = 0.0;
    }

    DEMANDSTATS_DEBUG("{} decomposition with period {}{}: seasonal strength {:.3f}, trend strength {:.3f}",
                      toString(model_), p, result.period_estimated ? " (estimated)" : "",
                      result.seasonal_strength, result.trend_strength);
    return result;
}

} // namespace demandstats::seasonality
