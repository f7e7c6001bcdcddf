#pragma once

#include "demand-stats/detectors/ioutlier_detector.hpp"

#include <memory>

namespace demandstats::detectors {

class ZScoreDetectorBuilder;

/**
 * @class ZScoreDetector
 * @brief Flags points whose standard score |x - mean| / sigma exceeds a threshold.
 *
 * sigma is the population standard deviation of the finite observations. A
 * series without spread has no outliers.
 */
class ZScoreDetector final : public IOutlierDetector {
public:
	friend class ZScoreDetectorBuilder;

	OutlierResult detect(const core::TimeSeries &ts) override;
	std::string getName() const override {
		return "ZScoreDetector";
	}

	double threshold() const {
		return threshold_;
	}

private:
	explicit ZScoreDetector(double threshold);

	double threshold_;
};

class ZScoreDetectorBuilder {
public:
	ZScoreDetectorBuilder &withThreshold(double threshold);

	/// @throws std::invalid_argument If the threshold is not positive.
	std::unique_ptr<ZScoreDetector> build();

private:
	double threshold_ = 3.0;
};

} // namespace demandstats::detectors
