#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace demandstats::seasonality {

enum class PeriodClass { Weekly, Monthly, Quarterly, Annual, Custom };

std::string toString(PeriodClass period_class);

/// Maps a period in observations (daily data) to a named seasonality type.
PeriodClass classifyPeriod(double period);

/**
 * Estimates the dominant seasonal period as the first local maximum of the
 * sample autocorrelation function. Falls back to a default period when the
 * ACF has no interior peak.
 */
class PeriodicityEstimator {
public:
    class Builder {
    public:
        Builder& maxLags(std::size_t value);
        Builder& defaultPeriod(std::size_t value);
        /// @throws std::invalid_argument If maxLags < 2 or defaultPeriod < 2.
        PeriodicityEstimator build() const;

    private:
        std::size_t max_lags_ = 40;
        std::size_t default_period_ = 12;
    };

    static Builder builder();

    /// Biased sample autocorrelation at lags 0..nlags; all zeros past lag 0 when variance is zero.
    static std::vector<double> autocorrelation(const std::vector<double>& data, std::size_t nlags);

    /// Missing values are dropped before the ACF is computed.
    std::size_t estimate(const std::vector<double>& data) const;

    std::size_t maxLags() const { return max_lags_; }
    std::size_t defaultPeriod() const { return default_period_; }

private:
    PeriodicityEstimator(std::size_t max_lags, std::size_t default_period);

    std::size_t max_lags_;
    std::size_t default_period_;
};

} // namespace demandstats::seasonality
