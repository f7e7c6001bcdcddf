#include "demand-stats/seasonality/spectral.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"
#include <Eigen/Dense>
#include <unsupported/Eigen/FFT>
#include <algorithm>
#include <complex>
#include <numeric>
#include <stdexcept>

namespace {

constexpr double kLinearFitTolerance = 1e-20;

// Residuals of the least-squares line through (i, data[i]).
Eigen::VectorXd detrendLinear(const std::vector<double>& data) {
    const std::size_t n = data.size();
    const double x_mean = static_cast<double>(n - 1) / 2.0;
    const double y_mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);

    double sxx = 0.0;
    double sxy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxx += dx * dx;
        sxy += dx * (data[i] - y_mean);
    }
    const double slope = sxx > 0.0 ? sxy / sxx : 0.0;

    Eigen::VectorXd residuals(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        residuals(static_cast<Eigen::Index>(i)) = data[i] - (y_mean + slope * (static_cast<double>(i) - x_mean));
    }
    return residuals;
}

} // namespace

namespace demandstats::seasonality {

SpectralSeasonalityDetector::SpectralSeasonalityDetector(double min_strength, double relative_height,
                                                         std::size_t min_peak_distance,
                                                         std::size_t min_observations)
    : min_strength_(min_strength), relative_height_(relative_height), min_peak_distance_(min_peak_distance),
      min_observations_(min_observations) {}

SpectralSeasonalityDetector::Builder& SpectralSeasonalityDetector::Builder::minStrength(double value) {
    min_strength_ = value;
    return *this;
}

SpectralSeasonalityDetector::Builder& SpectralSeasonalityDetector::Builder::relativeHeight(double value) {
    relative_height_ = value;
    return *this;
}

SpectralSeasonalityDetector::Builder& SpectralSeasonalityDetector::Builder::minPeakDistance(std::size_t value) {
    min_peak_distance_ = value;
    return *this;
}

SpectralSeasonalityDetector::Builder& SpectralSeasonalityDetector::Builder::minObservations(std::size_t value) {
    min_observations_ = value;
    return *this;
}

SpectralSeasonalityDetector SpectralSeasonalityDetector::Builder::build() const {
    if (!(min_strength_ > 0.0 && min_strength_ <= 1.0)) {
        throw std::invalid_argument("SpectralSeasonalityDetector requires minStrength in (0, 1].");
    }
    if (!(relative_height_ >= 0.0 && relative_height_ <= 1.0)) {
        throw std::invalid_argument("SpectralSeasonalityDetector requires relativeHeight in [0, 1].");
    }
    if (min_peak_distance_ < 1) {
        throw std::invalid_argument("SpectralSeasonalityDetector requires minPeakDistance >= 1.");
    }
    if (min_observations_ < 4) {
        throw std::invalid_argument("SpectralSeasonalityDetector requires minObservations >= 4.");
    }
    return SpectralSeasonalityDetector(min_strength_, relative_height_, min_peak_distance_, min_observations_);
}

SpectralSeasonalityDetector::Builder SpectralSeasonalityDetector::builder() {
    return Builder();
}

Periodogram SpectralSeasonalityDetector::periodogram(const std::vector<double>& data) const {
    Periodogram result;
    const std::size_t n = data.size();
    if (n < 4) {
        DEMANDSTATS_DEBUG("Periodogram skipped: {} observations", n);
        return result;
    }

    const auto range = std::minmax_element(data.begin(), data.end());
    if (*range.first == *range.second) {
        DEMANDSTATS_DEBUG("Periodogram skipped: series is constant.");
        return result;
    }

    const Eigen::VectorXd detrended = detrendLinear(data);
    const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
    double centered_ss = 0.0;
    for (double v : data) {
        centered_ss += (v - mean) * (v - mean);
    }
    if (detrended.squaredNorm() <= kLinearFitTolerance * centered_ss) {
        DEMANDSTATS_DEBUG("Periodogram skipped: series is an exact straight line.");
        return result;
    }

    Eigen::FFT<double> fft;
    Eigen::VectorXcd spectrum;
    fft.fwd(spectrum, detrended);

    result.length = n;
    const std::size_t half = n / 2;
    result.frequencies.reserve(half);
    result.powers.reserve(half);
    for (Eigen::Index k = 0; k < spectrum.size(); ++k) {
        const double power = std::norm(spectrum(k));
        result.total_power += power;
        result.max_power = std::max(result.max_power, power);
        if (static_cast<std::size_t>(k) < half) {
            result.frequencies.push_back(static_cast<double>(k) / static_cast<double>(n));
            result.powers.push_back(power);
        }
    }
    return result;
}

std::vector<PeriodogramPeak> Periodogram::peaks(double height, std::size_t min_distance) const {
    std::vector<PeriodogramPeak> result;
    const std::size_t m = powers.size();
    if (m < 3) {
        return result;
    }

    // Interior maxima; a flat top is reported at its (lower) midpoint.
    std::vector<std::size_t> candidates;
    std::size_t i = 1;
    while (i + 1 < m) {
        if (powers[i - 1] < powers[i]) {
            std::size_t ahead = i + 1;
            while (ahead + 1 < m && powers[ahead] == powers[i]) {
                ++ahead;
            }
            if (powers[ahead] < powers[i]) {
                const std::size_t mid = (i + ahead - 1) / 2;
                if (powers[mid] >= height) {
                    candidates.push_back(mid);
                }
                i = ahead;
            }
        }
        ++i;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [this](std::size_t a, std::size_t b) { return powers[a] > powers[b]; });

    std::vector<std::size_t> kept;
    for (std::size_t bin : candidates) {
        const bool too_close = std::any_of(kept.begin(), kept.end(), [bin, min_distance](std::size_t other) {
            const std::size_t gap = bin > other ? bin - other : other - bin;
            return gap < min_distance;
        });
        if (too_close) {
            continue;
        }
        kept.push_back(bin);

        PeriodogramPeak peak;
        peak.bin = bin;
        peak.frequency = frequencies[bin];
        peak.period = static_cast<double>(length) / static_cast<double>(bin);
        peak.power = powers[bin];
        result.push_back(peak);
    }
    return result;
}

SpectralSeasonality SpectralSeasonalityDetector::detect(const std::vector<double>& data) const {
    SpectralSeasonality result;
    const auto clean = utils::Statistics::finiteValues(data);
    if (clean.size() < min_observations_) {
        DEMANDSTATS_WARN("Spectral seasonality detection needs {} observations, got {}", min_observations_,
                         clean.size());
        return result;
    }
    result.sufficient_data = true;

    const auto pg = periodogram(clean);
    if (pg.powers.empty() || pg.total_power <= 0.0) {
        return result;
    }

    const double n = static_cast<double>(pg.length);
    for (const auto& peak : pg.peaks(pg.max_power * relative_height_, min_peak_distance_)) {
        if (peak.period < 2.0 || peak.period > n / 2.0) {
            continue;
        }
        const double strength = peak.power / pg.total_power;
        if (strength < min_strength_) {
            continue;
        }
        SeasonalPattern pattern;
        pattern.type = classifyPeriod(peak.period);
        pattern.period = peak.period;
        pattern.strength = strength;
        pattern.frequency = 1.0 / peak.period;
        result.patterns.push_back(pattern);
    }

    std::stable_sort(result.patterns.begin(), result.patterns.end(),
                     [](const SeasonalPattern& a, const SeasonalPattern& b) { return a.strength > b.strength; });

    if (!result.patterns.empty()) {
        result.has_seasonality = true;
        result.dominant_period = result.patterns.front().period;
        result.dominant_strength = result.patterns.front().strength;
        DEMANDSTATS_DEBUG("Spectral seasonality: {} pattern(s), dominant period {:.2f} (strength {:.3f})",
                          result.patterns.size(), result.dominant_period, result.dominant_strength);
    }
    return result;
}

} // namespace demandstats::seasonality
