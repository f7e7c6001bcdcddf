#include "demand-stats/stationarity/tester.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace demandstats::stationarity {

std::string StationarityVerdict::interpretation() const {
	if (std::isnan(adf_statistic) || std::isnan(kpss_statistic)) {
		return "undefined";
	}
	if (is_stationary) {
		return "stationary";
	}
	if (adf_stationary) {
		return "difference-stationary";
	}
	if (kpss_stationary) {
		return "trend-stationary";
	}
	return "non-stationary";
}

StationarityTester::StationarityTester(AugmentedDickeyFuller adf, KpssTest kpss)
    : adf_(std::move(adf)), kpss_(std::move(kpss)) {
}

StationarityTester::Builder &StationarityTester::Builder::withAdf(const AugmentedDickeyFuller &adf) {
	adf_ = adf;
	return *this;
}

StationarityTester::Builder &StationarityTester::Builder::withKpss(const KpssTest &kpss) {
	kpss_ = kpss;
	return *this;
}

StationarityTester StationarityTester::Builder::build() const {
	return StationarityTester(adf_, kpss_);
}

StationarityTester::Builder StationarityTester::builder() {
	return Builder();
}

std::size_t StationarityTester::minObservations() {
	return std::max(AugmentedDickeyFuller::kMinObservations, KpssTest::kMinObservations);
}

StationarityVerdict StationarityTester::test(const core::TimeSeries &series) const {
	return test(series.getValues());
}

StationarityVerdict StationarityTester::test(const std::vector<double> &data) const {
	const auto clean = utils::Statistics::finiteValues(data);
	if (clean.size() < data.size()) {
		DEMANDSTATS_DEBUG("Stationarity test dropped {} missing values", data.size() - clean.size());
	}
	if (clean.size() < minObservations()) {
		throw std::invalid_argument("Stationarity testing requires at least " + std::to_string(minObservations()) +
		                            " observations, got " + std::to_string(clean.size()) + ".");
	}

	StationarityVerdict verdict;
	verdict.adf = adf_.test(clean);
	verdict.kpss = kpss_.test(clean);
	verdict.adf_statistic = verdict.adf.statistic;
	verdict.adf_p_value = verdict.adf.p_value;
	verdict.adf_stationary = verdict.adf.is_stationary;
	verdict.kpss_statistic = verdict.kpss.statistic;
	verdict.kpss_p_value = verdict.kpss.p_value;
	verdict.kpss_stationary = verdict.kpss.is_stationary;
	verdict.is_stationary = verdict.adf_stationary && verdict.kpss_stationary;

	DEMANDSTATS_DEBUG("Stationarity over {} points: {} (ADF p={:.4g}, KPSS p={:.4g})", clean.size(),
	                  verdict.interpretation(), verdict.adf_p_value, verdict.kpss_p_value);
	return verdict;
}

DifferencingRecommendation StationarityTester::recommendDifferencing(const core::TimeSeries &series,
                                                                     std::size_t max_order) const {
	DifferencingRecommendation recommendation;
	recommendation.order = max_order;

	auto current = series.dropMissing();
	for (std::size_t order = 0; order <= max_order; ++order) {
		if (order > 0) {
			current = current.differenced();
		}
		if (current.size() < minObservations()) {
			DEMANDSTATS_DEBUG("Differencing order {} leaves {} observations; stopping", order, current.size());
			break;
		}
		recommendation.verdicts.push_back(test(current.getValues()));
		if (recommendation.verdicts.back().is_stationary) {
			recommendation.order = order;
			recommendation.stationary_found = true;
			break;
		}
	}
	if (!recommendation.stationary_found) {
		DEMANDSTATS_DEBUG("No differencing order up to {} produced a stationary series", max_order);
	}
	return recommendation;
}

DifferencingRecommendation StationarityTester::recommendDifferencing(const std::vector<double> &data,
                                                                     std::size_t max_order) const {
	return recommendDifferencing(core::TimeSeries(data), max_order);
}

} // namespace demandstats::stationarity
