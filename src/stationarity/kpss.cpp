#include "demand-stats/stationarity/kpss.hpp"

#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/ols.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace demandstats::stationarity {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Kwiatkowski et al. (1992) table, ordered by decreasing p-value.
constexpr std::array<double, 4> kTablePValues {0.10, 0.05, 0.025, 0.01};
constexpr std::array<double, 4> kLevelCritical {0.347, 0.463, 0.574, 0.739};
constexpr std::array<double, 4> kTrendCritical {0.119, 0.146, 0.176, 0.216};

const std::array<double, 4> &criticalTable(KpssRegression regression) {
	return regression == KpssRegression::Trend ? kTrendCritical : kLevelCritical;
}

double autocovarianceSum(const std::vector<double> &resid, std::size_t lag) {
	double sum = 0.0;
	for (std::size_t j = lag; j < resid.size(); ++j) {
		sum += resid[j] * resid[j - lag];
	}
	return sum;
}

// Hobijn, Franses and Ooms (1998) automatic bandwidth.
std::size_t automaticLags(const std::vector<double> &resid) {
	const double n = static_cast<double>(resid.size());
	const auto covlags = static_cast<std::size_t>(std::pow(n, 2.0 / 9.0));
	double s0 = autocovarianceSum(resid, 0) / n;
	double s1 = 0.0;
	for (std::size_t i = 1; i <= covlags && i < resid.size(); ++i) {
		const double product = autocovarianceSum(resid, i) / (n / 2.0);
		s0 += product;
		s1 += static_cast<double>(i) * product;
	}
	const double s_hat = s1 / s0;
	const double gamma = 1.1447 * std::cbrt(s_hat * s_hat);
	const double lags = gamma * std::cbrt(n);
	if (!std::isfinite(lags) || lags < 0.0) {
		return 0;
	}
	return static_cast<std::size_t>(lags);
}

std::vector<double> residuals(const std::vector<double> &x, KpssRegression regression) {
	const std::size_t n = x.size();
	std::vector<double> resid(n);
	if (regression == KpssRegression::Level) {
		const double mean = utils::Statistics::mean(x);
		for (std::size_t i = 0; i < n; ++i) {
			resid[i] = x[i] - mean;
		}
		return resid;
	}
	Eigen::MatrixXd design(static_cast<Eigen::Index>(n), 2);
	Eigen::VectorXd response(static_cast<Eigen::Index>(n));
	for (std::size_t i = 0; i < n; ++i) {
		design(static_cast<Eigen::Index>(i), 0) = 1.0;
		design(static_cast<Eigen::Index>(i), 1) = static_cast<double>(i + 1);
		response(static_cast<Eigen::Index>(i)) = x[i];
	}
	const auto fit = utils::OrdinaryLeastSquares::fit(design, response);
	const Eigen::VectorXd r = response - design * fit.params;
	for (std::size_t i = 0; i < n; ++i) {
		resid[i] = r(static_cast<Eigen::Index>(i));
	}
	return resid;
}

} // namespace

KpssTest::KpssTest(KpssRegression regression, std::optional<std::size_t> lags, double alpha)
    : regression_(regression), lags_(lags), alpha_(alpha) {
}

KpssTest::Builder &KpssTest::Builder::withRegression(KpssRegression regression) {
	regression_ = regression;
	return *this;
}

KpssTest::Builder &KpssTest::Builder::withLags(std::size_t lags) {
	lags_ = lags;
	return *this;
}

KpssTest::Builder &KpssTest::Builder::withSignificance(double alpha) {
	alpha_ = alpha;
	return *this;
}

KpssTest KpssTest::Builder::build() const {
	if (!(alpha_ > 0.0 && alpha_ < 1.0)) {
		throw std::invalid_argument("KPSS significance level must lie strictly between 0 and 1.");
	}
	return KpssTest(regression_, lags_, alpha_);
}

KpssTest::Builder KpssTest::builder() {
	return Builder();
}

double KpssTest::pValue(double statistic, KpssRegression regression) {
	if (std::isnan(statistic)) {
		return kNaN;
	}
	const auto &crit = criticalTable(regression);
	if (statistic <= crit.front()) {
		return kTablePValues.front();
	}
	if (statistic >= crit.back()) {
		return kTablePValues.back();
	}
	for (std::size_t k = 0; k + 1 < crit.size(); ++k) {
		if (statistic <= crit[k + 1]) {
			const double fraction = (statistic - crit[k]) / (crit[k + 1] - crit[k]);
			return kTablePValues[k] + fraction * (kTablePValues[k + 1] - kTablePValues[k]);
		}
	}
	return kTablePValues.back();
}

KpssResult KpssTest::test(const std::vector<double> &data) const {
	const auto x = utils::Statistics::finiteValues(data);
	const std::size_t n = x.size();
	if (n < kMinObservations) {
		throw std::invalid_argument("KPSS test requires at least " + std::to_string(kMinObservations) +
		                            " observations, got " + std::to_string(n) + ".");
	}
	if (lags_ && *lags_ >= n) {
		throw std::invalid_argument("KPSS lag count must be smaller than the number of observations.");
	}

	KpssResult result;
	result.nobs = n;
	const auto &crit = criticalTable(regression_);
	result.critical_values = {{"10%", crit[0]}, {"5%", crit[1]}, {"2.5%", crit[2]}, {"1%", crit[3]}};

	if (utils::Statistics::variance(x, 0) == 0.0) {
		DEMANDSTATS_WARN("KPSS test on a constant series is undefined; reporting NaN statistic");
		result.statistic = kNaN;
		result.p_value = kNaN;
		return result;
	}

	const auto resid = residuals(x, regression_);
	result.lags = lags_ ? *lags_ : std::min(automaticLags(resid), n - 1);

	double partial = 0.0;
	double eta = 0.0;
	for (double r : resid) {
		partial += r;
		eta += partial * partial;
	}
	eta /= static_cast<double>(n) * static_cast<double>(n);

	double long_run = autocovarianceSum(resid, 0);
	for (std::size_t i = 1; i <= result.lags; ++i) {
		const double bartlett = 1.0 - static_cast<double>(i) / static_cast<double>(result.lags + 1);
		long_run += 2.0 * bartlett * autocovarianceSum(resid, i);
	}
	long_run /= static_cast<double>(n);

	if (!(long_run > 0.0)) {
		DEMANDSTATS_WARN("KPSS long-run variance is not positive ({}); reporting NaN statistic", long_run);
		result.statistic = kNaN;
		result.p_value = kNaN;
		return result;
	}

	result.statistic = eta / long_run;
	result.p_value = pValue(result.statistic, regression_);
	result.is_stationary = result.p_value > alpha_;
	DEMANDSTATS_DEBUG("KPSS statistic {:.4f}, p-value {:.4g}, lags {}", result.statistic, result.p_value,
	                  result.lags);
	return result;
}

} // namespace demandstats::stationarity
