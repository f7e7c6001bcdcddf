#include "demand-stats/detectors/zscore.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::detectors {

ZScoreDetector::ZScoreDetector(double threshold) : threshold_(threshold) {
	if (!(threshold_ > 0.0)) {
		throw std::invalid_argument("Z-score threshold must be positive.");
	}
}

OutlierResult ZScoreDetector::detect(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	OutlierResult result;
	result.flags.assign(values.size(), false);
	result.scores.assign(values.size(), 0.0);
	result.threshold = threshold_;

	const auto finite = utils::Statistics::finiteValues(values);
	if (finite.empty()) {
		DEMANDSTATS_WARN("ZScoreDetector received no finite observations. Returning no outliers.");
		return result;
	}

	const double mean = utils::Statistics::mean(finite);
	const double sigma = utils::Statistics::stddev(finite, 0);
	if (sigma == 0.0) {
		DEMANDSTATS_DEBUG("Standard deviation is zero. No outliers will be detected.");
		return result;
	}

	for (std::size_t i = 0; i < values.size(); ++i) {
		if (!std::isfinite(values[i])) {
			result.scores[i] = std::numeric_limits<double>::quiet_NaN();
			continue;
		}
		result.scores[i] = std::abs(values[i] - mean) / sigma;
		if (result.scores[i] > threshold_) {
			result.markOutlier(i);
		}
	}

	DEMANDSTATS_DEBUG("ZScoreDetector found {} outliers.", result.count());
	return result;
}

ZScoreDetectorBuilder &ZScoreDetectorBuilder::withThreshold(double threshold) {
	threshold_ = threshold;
	return *this;
}

std::unique_ptr<ZScoreDetector> ZScoreDetectorBuilder::build() {
	DEMANDSTATS_DEBUG("Building ZScoreDetector with threshold {}.", threshold_);
	return std::unique_ptr<ZScoreDetector>(new ZScoreDetector(threshold_));
}

} // namespace demandstats::detectors
