#pragma once

#include "demand-stats/seasonality/periodicity.hpp"

#include <cstddef>
#include <limits>
#include <vector>

namespace demandstats::seasonality {

struct PeriodogramPeak {
    std::size_t bin = 0;
    double frequency = 0.0;
    double period = 0.0;
    double power = 0.0;
};

/**
 * Squared DFT magnitudes of a linearly detrended series. Only the bins below
 * n/2 are kept; max_power and total_power cover the full two-sided spectrum.
 */
struct Periodogram {
    std::vector<double> frequencies;
    std::vector<double> powers;
    std::size_t length = 0;
    double max_power = 0.0;
    double total_power = 0.0;

    /// Strict interior maxima with power >= height, at least min_distance bins apart, strongest first.
    [[nodiscard]] std::vector<PeriodogramPeak> peaks(double height, std::size_t min_distance) const;
};

struct SeasonalPattern {
    PeriodClass type = PeriodClass::Custom;
    double period = 0.0;
    double strength = 0.0;
    double frequency = 0.0;
};

struct SpectralSeasonality {
    bool has_seasonality = false;
    bool sufficient_data = false;
    // Strongest first.
    std::vector<SeasonalPattern> patterns;
    double dominant_period = std::numeric_limits<double>::quiet_NaN();
    double dominant_strength = 0.0;
};

/**
 * Detects seasonal cycles from the power spectrum. A peak becomes a pattern
 * when its period lies in [2, n/2] and its share of the total spectral power
 * reaches minStrength.
 */
class SpectralSeasonalityDetector {
public:
    class Builder {
    public:
        Builder& minStrength(double value);
        /// Peak height cutoff as a fraction of the largest spectral power.
        Builder& relativeHeight(double value);
        Builder& minPeakDistance(std::size_t value);
        Builder& minObservations(std::size_t value);
        /**
         * @throws std::invalid_argument If minStrength is outside (0, 1], relativeHeight
         *         outside [0, 1], minPeakDistance is 0 or minObservations < 4.
         */
        SpectralSeasonalityDetector build() const;

    private:
        double min_strength_ = 0.3;
        double relative_height_ = 0.1;
        std::size_t min_peak_distance_ = 3;
        std::size_t min_observations_ = 14;
    };

    static Builder builder();

    /// Empty when the series is constant or an exact straight line.
    Periodogram periodogram(const std::vector<double>& data) const;

    /// Missing values are dropped first; fewer than minObservations remaining reports no seasonality.
    SpectralSeasonality detect(const std::vector<double>& data) const;

    double minStrength() const { return min_strength_; }
    double relativeHeight() const { return relative_height_; }
    std::size_t minPeakDistance() const { return min_peak_distance_; }
    std::size_t minObservations() const { return min_observations_; }

private:
    SpectralSeasonalityDetector(double min_strength, double relative_height, std::size_t min_peak_distance,
                                std::size_t min_observations);

    double min_strength_;
    double relative_height_;
    std::size_t min_peak_distance_;
    std::size_t min_observations_;
};

} // namespace demandstats::seasonality
