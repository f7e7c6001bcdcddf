#pragma once

#include "demand-stats/detectors/ioutlier_detector.hpp"

#include <memory>

namespace demandstats::detectors {

class IQRDetectorBuilder;

/**
 * @class IQRDetector
 * @brief Tukey fences: flags x < Q1 - k * IQR or x > Q3 + k * IQR.
 *
 * Quartiles use linear interpolation between closest ranks. The score of a
 * point is its distance beyond the nearer fence in IQR units (0 inside).
 */
class IQRDetector final : public IOutlierDetector {
public:
	friend class IQRDetectorBuilder;

	OutlierResult detect(const core::TimeSeries &ts) override;
	std::string getName() const override {
		return "IQRDetector";
	}

	double multiplier() const {
		return multiplier_;
	}

private:
	explicit IQRDetector(double multiplier);

	double multiplier_;
};

class IQRDetectorBuilder {
public:
	IQRDetectorBuilder &withMultiplier(double multiplier);

	/// @throws std::invalid_argument If the multiplier is negative.
	std::unique_ptr<IQRDetector> build();

private:
	double multiplier_ = 1.5;
};

} // namespace demandstats::detectors
