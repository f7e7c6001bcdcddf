#pragma once

#include "demand-stats/detectors/ioutlier_detector.hpp"

#include <memory>

namespace demandstats::detectors {

class MADDetectorBuilder; // Forward declaration

/**
 * @class MADDetector
 * @brief Modified z-score detector based on the Median Absolute Deviation (MAD).
 *
 * Scores are 0.6745 * |x - median| / MAD. MAD is a robust measure of
 * variability and is resilient to the presence of outliers.
 */
class MADDetector final : public IOutlierDetector {
public:
	friend class MADDetectorBuilder;

	OutlierResult detect(const core::TimeSeries &ts) override;
	std::string getName() const override {
		return "MADDetector";
	}

	double threshold() const {
		return threshold_;
	}

private:
	/**
	 * @brief Private constructor for MADDetector.
	 * @param threshold The modified z-score above which a point is an outlier.
	 */
	explicit MADDetector(double threshold);

	double threshold_;
};

/**
 * @class MADDetectorBuilder
 * @brief A builder for fluently configuring and creating MADDetector instances.
 */
class MADDetectorBuilder {
public:
	MADDetectorBuilder &withThreshold(double threshold);

	/**
	 * @brief Creates a new MADDetector instance.
	 * @throws std::invalid_argument If the threshold is not positive.
	 */
	std::unique_ptr<MADDetector> build();

private:
	double threshold_ = 3.5;
};

} // namespace demandstats::detectors
