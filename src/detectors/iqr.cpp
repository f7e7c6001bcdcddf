#include "demand-stats/detectors/iqr.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::detectors {

IQRDetector::IQRDetector(double multiplier) : multiplier_(multiplier) {
	if (!(multiplier_ >= 0.0)) {
		throw std::invalid_argument("IQR multiplier must be non-negative.");
	}
}

OutlierResult IQRDetector::detect(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	OutlierResult result;
	result.flags.assign(values.size(), false);
	result.scores.assign(values.size(), 0.0);
	result.threshold = multiplier_;

	const auto finite = utils::Statistics::finiteValues(values);
	if (finite.empty()) {
		DEMANDSTATS_WARN("IQRDetector received no finite observations. Returning no outliers.");
		return result;
	}

	const double q1 = utils::Statistics::percentile(finite, 25.0);
	const double q3 = utils::Statistics::percentile(finite, 75.0);
	const double iqr = q3 - q1;
	const double lower = q1 - multiplier_ * iqr;
	const double upper = q3 + multiplier_ * iqr;
	if (iqr == 0.0) {
		DEMANDSTATS_DEBUG("Interquartile range is zero; fences collapse to {}", q1);
	}

	for (std::size_t i = 0; i < values.size(); ++i) {
		const double x = values[i];
		if (!std::isfinite(x)) {
			result.scores[i] = std::numeric_limits<double>::quiet_NaN();
			continue;
		}
		const double excess = x < q1 ? q1 - x : (x > q3 ? x - q3 : 0.0);
		if (iqr > 0.0) {
			result.scores[i] = excess / iqr;
		} else {
			result.scores[i] = excess > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
		}
		if (x < lower || x > upper) {
			result.markOutlier(i);
		}
	}

	DEMANDSTATS_DEBUG("IQRDetector found {} outliers (fences [{}, {}]).", result.count(), lower, upper);
	return result;
}

IQRDetectorBuilder &IQRDetectorBuilder::withMultiplier(double multiplier) {
	multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<IQRDetector> IQRDetectorBuilder::build() {
	DEMANDSTATS_DEBUG("Building IQRDetector with multiplier {}.", multiplier_);
	return std::unique_ptr<IQRDetector>(new IQRDetector(multiplier_));
}

} // namespace demandstats::detectors
