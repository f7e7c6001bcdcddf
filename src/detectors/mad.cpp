#include "demand-stats/detectors/mad.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace demandstats::detectors {

namespace {
// 75th percentile of the standard normal; scales MAD to a standard deviation.
constexpr double kMadToStdDevFactor = 0.6745;
} // namespace

MADDetector::MADDetector(double threshold) : threshold_(threshold) {
	if (!(threshold_ > 0.0)) {
		throw std::invalid_argument("MAD threshold must be positive.");
	}
}

OutlierResult MADDetector::detect(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	OutlierResult result;
	result.flags.assign(values.size(), false);
	result.scores.assign(values.size(), 0.0);
	result.threshold = threshold_;

	const auto finite = utils::Statistics::finiteValues(values);
	if (finite.empty()) {
		DEMANDSTATS_WARN("MADDetector received no finite observations. Returning no outliers.");
		return result;
	}

	const double median = utils::Statistics::median(finite);
	std::vector<double> deviations;
	deviations.reserve(finite.size());
	for (double val : finite) {
		deviations.push_back(std::abs(val - median));
	}
	const double mad = utils::Statistics::median(deviations);

	// A MAD of 0 means at least half the points are identical; nothing stands out.
	if (mad == 0.0) {
		DEMANDSTATS_DEBUG("Median Absolute Deviation is zero. No outliers will be detected.");
		return result;
	}

	for (std::size_t i = 0; i < values.size(); ++i) {
		if (!std::isfinite(values[i])) {
			result.scores[i] = std::numeric_limits<double>::quiet_NaN();
			continue;
		}
		result.scores[i] = kMadToStdDevFactor * std::abs(values[i] - median) / mad;
		if (result.scores[i] > threshold_) {
			result.markOutlier(i);
		}
	}

	DEMANDSTATS_DEBUG("MADDetector found {} outliers.", result.count());
	return result;
}

MADDetectorBuilder &MADDetectorBuilder::withThreshold(double threshold) {
	threshold_ = threshold;
	return *this;
}

std::unique_ptr<MADDetector> MADDetectorBuilder::build() {
	DEMANDSTATS_DEBUG("Building MADDetector with threshold {}.", threshold_);
	return std::unique_ptr<MADDetector>(new MADDetector(threshold_));
}

} // namespace demandstats::detectors
