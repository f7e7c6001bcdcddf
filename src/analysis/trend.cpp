#include "demand-stats/analysis/trend.hpp"

#include "demand-stats/utils/distributions.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/ols.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::analysis {

namespace {
constexpr double kPerfectFitTolerance = 1e-20;
} // namespace

std::string toString(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::Increasing:
		return "increasing";
	case TrendDirection::Decreasing:
		return "decreasing";
	case TrendDirection::Stable:
		return "stable";
	case TrendDirection::InsufficientData:
		return "insufficient_data";
	}
	return "stable";
}

TrendAnalyzer::TrendAnalyzer(double significance) : significance_(significance) {
	if (!(significance_ > 0.0 && significance_ < 1.0)) {
		throw std::invalid_argument("Trend significance level must lie strictly between 0 and 1.");
	}
}

TrendReport TrendAnalyzer::analyze(const std::vector<double> &values) const {
	return analyze(core::TimeSeries(values));
}

TrendReport TrendAnalyzer::analyze(const core::TimeSeries &series) const {
	const auto axis = series.timeAxis();
	const auto &values = series.getValues();
	std::vector<double> x;
	std::vector<double> y;
	x.reserve(values.size());
	y.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (std::isfinite(values[i])) {
			x.push_back(axis[i]);
			y.push_back(values[i]);
		}
	}
	return fit(x, y);
}

TrendReport TrendAnalyzer::fit(const std::vector<double> &x, const std::vector<double> &y) const {
	TrendReport report;
	if (y.size() < 3) {
		DEMANDSTATS_DEBUG("Trend analysis needs three observations, got {}", y.size());
		return report;
	}

	const auto [lowest, highest] = std::minmax_element(y.begin(), y.end());
	if (*lowest == *highest) {
		report.intercept = y.front();
		report.direction = TrendDirection::Stable;
		DEMANDSTATS_DEBUG("Trend analysis on a constant series; reporting no trend");
		return report;
	}

	const auto n = static_cast<Eigen::Index>(y.size());
	Eigen::MatrixXd design(n, 2);
	Eigen::VectorXd response(n);
	for (Eigen::Index i = 0; i < n; ++i) {
		design(i, 0) = 1.0;
		design(i, 1) = x[static_cast<std::size_t>(i)];
		response(i) = y[static_cast<std::size_t>(i)];
	}
	const auto ols = utils::OrdinaryLeastSquares::fit(design, response);

	report.intercept = ols.params(0);
	report.slope = ols.params(1);
	report.r_squared = ols.r_squared;
	report.t_statistic = ols.t_values(1);
	// Exact collinearity leaves only round-off in the residuals.
	const double tss = (response.array() - response.mean()).square().sum();
	if (ols.ssr <= kPerfectFitTolerance * tss) {
		report.t_statistic = std::copysign(std::numeric_limits<double>::infinity(), report.slope);
	}
	report.p_value = utils::Distributions::studentTTwoSidedPValue(report.t_statistic, static_cast<double>(n - 2));
	report.has_trend = report.p_value < significance_;
	if (report.has_trend && report.slope > 0.0) {
		report.direction = TrendDirection::Increasing;
	} else if (report.has_trend && report.slope < 0.0) {
		report.direction = TrendDirection::Decreasing;
	} else {
		report.direction = TrendDirection::Stable;
	}

	DEMANDSTATS_DEBUG("Trend slope {:.4g} (t={:.3f}, p={:.4g}) -> {}", report.slope, report.t_statistic,
	                  report.p_value, toString(report.direction));
	return report;
}

} // namespace demandstats::analysis
