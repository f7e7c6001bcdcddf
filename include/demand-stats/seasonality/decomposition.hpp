#pragma once

#include "demand-stats/core/time_series.hpp"
#include "demand-stats/seasonality/periodicity.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace demandstats::seasonality {

enum class DecompositionModel { Additive, Multiplicative };

std::string toString(DecompositionModel model);

/**
 * Classical moving-average decomposition. Trend and residual are NaN at the
 * period / 2 points on each edge where the centred moving average is
 * undefined.
 */
struct DecompositionResult {
    std::vector<double> observed;
    std::vector<double> trend;
    std::vector<double> seasonal;
    std::vector<double> residual;
    std::size_t period = 0;
    bool period_estimated = false;
    DecompositionModel model = DecompositionModel::Additive;
    double trend_strength = 0.0;
    double seasonal_strength = 0.0;
    double noise_ratio = 0.0;
};

class SeasonalDecomposer {
public:
    class Builder {
    public:
        Builder& withModel(DecompositionModel model);
        /// Fixed period; when unset the period is estimated from the data.
        Builder& withPeriod(std::size_t period);
        Builder& withPeriodicityEstimator(const PeriodicityEstimator& estimator);
        /// @throws std::invalid_argument If an explicit period is below 2.
        SeasonalDecomposer build() const;

    private:
        DecompositionModel model_ = DecompositionModel::Additive;
        std::optional<std::size_t> period_;
        PeriodicityEstimator estimator_ = PeriodicityEstimator::builder().build();
    };

    static Builder builder();

    /**
     * @throws std::invalid_argument On missing values, fewer than 2 * period
     *         observations, or non-positive values in multiplicative mode.
     */
    DecompositionResult decompose(const std::vector<double>& data) const;
    DecompositionResult decompose(const core::TimeSeries& series) const;

    /// 1 - Var(resid) / (Var(seasonal) + Var(resid)), clamped to [0, 1].
    static double seasonalStrength(const std::vector<double>& seasonal, const std::vector<double>& residual);

    /// 1 - Var(resid) / Var(trend + resid), clamped to [0, 1].
    static double trendStrength(const std::vector<double>& trend, const std::vector<double>& residual);

private:
    SeasonalDecomposer(DecompositionModel model, std::optional<std::size_t> period, PeriodicityEstimator estimator);

    DecompositionModel model_;
    std::optional<std::size_t> period_;
    PeriodicityEstimator estimator_;
};

} // namespace demandstats::seasonality
