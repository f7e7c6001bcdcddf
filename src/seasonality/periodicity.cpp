#include "demand-stats/seasonality/periodicity.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace demandstats::seasonality {

std::string toString(PeriodClass period_class) {
    switch (period_class) {
    case PeriodClass::Weekly:
        return "weekly";
    case PeriodClass::Monthly:
        return "monthly";
    case PeriodClass::Quarterly:
        return "quarterly";
    case PeriodClass::Annual:
        return "annual";
    case PeriodClass::Custom:
        return "custom";
    }
    return "custom";
}

PeriodClass classifyPeriod(double period) {
    if (period >= 6.5 && period <= 7.5) {
        return PeriodClass::Weekly;
    }
    if (period >= 28.0 && period <= 32.0) {
        return PeriodClass::Monthly;
    }
    if (period >= 85.0 && period <= 95.0) {
        return PeriodClass::Quarterly;
    }
    if (period >= 360.0 && period <= 370.0) {
        return PeriodClass::Annual;
    }
    return PeriodClass::Custom;
}

PeriodicityEstimator::PeriodicityEstimator(std::size_t max_lags, std::size_t default_period)
    : max_lags_(max_lags), default_period_(default_period) {}

PeriodicityEstimator::Builder& PeriodicityEstimator::Builder::maxLags(std::size_t value) {
    max_lags_ = value;
    return *this;
}

PeriodicityEstimator::Builder& PeriodicityEstimator::Builder::defaultPeriod(std::size_t value) {
    default_period_ = value;
    return *this;
}

PeriodicityEstimator PeriodicityEstimator::Builder::build() const {
    if (max_lags_ < 2) {
        throw std::invalid_argument("PeriodicityEstimator requires maxLags >= 2.");
    }
    if (default_period_ < 2) {
        throw std::invalid_argument("PeriodicityEstimator requires defaultPeriod >= 2.");
    }
    return PeriodicityEstimator(max_lags_, default_period_);
}

PeriodicityEstimator::Builder PeriodicityEstimator::builder() {
    return Builder();
}

std::vector<double> PeriodicityEstimator::autocorrelation(const std::vector<double>& data, std::size_t nlags) {
    std::vector<double> acf(nlags + 1, 0.0);
    if (data.empty()) {
        return acf;
    }
    const std::size_t n = data.size();
    const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
    std::vector<double> centered(n);
    std::transform(data.begin(), data.end(), centered.begin(), [mean](double v) { return v - mean; });

    const double denom = std::inner_product(centered.begin(), centered.end(), centered.begin(), 0.0);
    if (denom <= 0.0) {
        return acf;
    }
    acf[0] = 1.0;
    for (std::size_t lag = 1; lag <= nlags && lag < n; ++lag) {
        double numerator = 0.0;
        for (std::size_t t = 0; t + lag < n; ++t) {
            numerator += centered[t] * centered[t + lag];
        }
        acf[lag] = numerator / denom;
    }
    return acf;
}

std::size_t PeriodicityEstimator::estimate(const std::vector<double>& data) const {
    const auto clean = utils::Statistics::finiteValues(data);
    const std::size_t nlags = std::min(clean.size() / 2, max_lags_);
    if (nlags < 2) {
        DEMANDSTATS_DEBUG("Period estimation: {} observations are too few; using default {}", clean.size(),
                          default_period_);
        return default_period_;
    }

    const auto acf = autocorrelation(clean, nlags);
    for (std::size_t i = 1; i + 1 < acf.size(); ++i) {
        if (acf[i] > acf[i - 1] && acf[i] > acf[i + 1]) {
            DEMANDSTATS_DEBUG("Estimated seasonal period {} (acf {:.3f})", i, acf[i]);
            return i;
        }
    }
    DEMANDSTATS_DEBUG("No autocorrelation peak within {} lags; using default period {}", nlags, default_period_);
    return default_period_;
}

} // namespace demandstats::seasonality
