#pragma once

#include "demand-stats/core/time_series.hpp"
#include "demand-stats/stationarity/adf.hpp"
#include "demand-stats/stationarity/kpss.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace demandstats::stationarity {

/**
 * @brief Combined ADF / KPSS verdict.
 *
 * The series is called stationary only when ADF rejects a unit root and KPSS
 * does not reject stationarity. Disagreement yields is_stationary == false.
 */
struct StationarityVerdict {
	double adf_statistic = 0.0;
	double adf_p_value = 1.0;
	bool adf_stationary = false;
	double kpss_statistic = 0.0;
	double kpss_p_value = 0.1;
	bool kpss_stationary = false;
	bool is_stationary = false;
	AdfResult adf;
	KpssResult kpss;

	/// Short reading of the two tests, e.g. "trend-stationary" for ADF fail / KPSS pass.
	std::string interpretation() const;
};

struct DifferencingRecommendation {
	/// Smallest order whose differenced series passes both tests, else the maximum order.
	std::size_t order = 0;
	bool stationary_found = false;
	/// Verdicts for orders 0..k, in order, for every order that could be tested.
	std::vector<StationarityVerdict> verdicts;
};

class StationarityTester {
public:
	class Builder {
	public:
		Builder &withAdf(const AugmentedDickeyFuller &adf);
		Builder &withKpss(const KpssTest &kpss);
		StationarityTester build() const;

	private:
		AugmentedDickeyFuller adf_ = AugmentedDickeyFuller::builder().build();
		KpssTest kpss_ = KpssTest::builder().build();
	};

	static Builder builder();

	/// Minimum number of finite observations accepted by test().
	static std::size_t minObservations();

	/**
	 * @brief Runs both tests after dropping missing values.
	 * @throws std::invalid_argument If too few observations remain.
	 */
	StationarityVerdict test(const std::vector<double> &data) const;
	StationarityVerdict test(const core::TimeSeries &series) const;

	/**
	 * @brief Finds the differencing order that makes the series stationary.
	 *
	 * Orders whose differenced series would be shorter than minObservations()
	 * are not tested.
	 */
	DifferencingRecommendation recommendDifferencing(const core::TimeSeries &series, std::size_t max_order = 2) const;
	DifferencingRecommendation recommendDifferencing(const std::vector<double> &data, std::size_t max_order = 2) const;

private:
	StationarityTester(AugmentedDickeyFuller adf, KpssTest kpss);

	AugmentedDickeyFuller adf_;
	KpssTest kpss_;
};

} // namespace demandstats::stationarity
