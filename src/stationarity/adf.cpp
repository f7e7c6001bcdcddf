#include "demand-stats/stationarity/adf.hpp"

#include "demand-stats/utils/distributions.hpp"
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

// MacKinnon (1994) response surface, one unit root, constant only.
constexpr double kTauMax = 2.74;
constexpr double kTauMin = -18.83;
constexpr double kTauStar = -1.61;
constexpr std::array<double, 3> kSmallP {2.1659, 1.4412, 0.038269};
constexpr std::array<double, 4> kLargeP {1.7339, 0.93202, -0.12745, -0.010368};

// MacKinnon (2010) critical value polynomials in 1 / nobs.
constexpr std::array<double, 4> kCrit1 {-3.43035, -6.5393, -16.786, -79.433};
constexpr std::array<double, 4> kCrit5 {-2.86154, -2.8903, -4.234, -40.040};
constexpr std::array<double, 4> kCrit10 {-2.56677, -1.5384, -2.809, 0.0};

template <std::size_t N>
double polynomial(const std::array<double, N> &coefficients, double x) {
	double result = 0.0;
	double power = 1.0;
	for (double c : coefficients) {
		result += c * power;
		power *= x;
	}
	return result;
}

// Regression rows for diff(x)[t], t = first..n-2: [1, x[t], dx[t-1], ..., dx[t-lags]].
void buildDesign(const std::vector<double> &x, const std::vector<double> &dx, std::size_t first, std::size_t lags,
                 Eigen::MatrixXd &design, Eigen::VectorXd &response) {
	const auto rows = static_cast<Eigen::Index>(dx.size() - first);
	design.resize(rows, static_cast<Eigen::Index>(lags + 2));
	response.resize(rows);
	for (Eigen::Index r = 0; r < rows; ++r) {
		const std::size_t t = first + static_cast<std::size_t>(r);
		response(r) = dx[t];
		design(r, 0) = 1.0;
		design(r, 1) = x[t];
		for (std::size_t j = 1; j <= lags; ++j) {
			design(r, static_cast<Eigen::Index>(j + 1)) = dx[t - j];
		}
	}
}

} // namespace

AugmentedDickeyFuller::AugmentedDickeyFuller(LagSelection selection, std::optional<std::size_t> max_lag,
                                             double alpha)
    : selection_(selection), max_lag_(max_lag), alpha_(alpha) {
}

AugmentedDickeyFuller::Builder &AugmentedDickeyFuller::Builder::withAutolag(LagSelection selection) {
	selection_ = selection;
	return *this;
}

AugmentedDickeyFuller::Builder &AugmentedDickeyFuller::Builder::withMaxLag(std::size_t max_lag) {
	max_lag_ = max_lag;
	return *this;
}

AugmentedDickeyFuller::Builder &AugmentedDickeyFuller::Builder::withSignificance(double alpha) {
	alpha_ = alpha;
	return *this;
}

AugmentedDickeyFuller AugmentedDickeyFuller::Builder::build() const {
	if (!(alpha_ > 0.0 && alpha_ < 1.0)) {
		throw std::invalid_argument("ADF significance level must lie strictly between 0 and 1.");
	}
	return AugmentedDickeyFuller(selection_, max_lag_, alpha_);
}

AugmentedDickeyFuller::Builder AugmentedDickeyFuller::builder() {
	return Builder();
}

double AugmentedDickeyFuller::mackinnonPValue(double statistic) {
	if (std::isnan(statistic)) {
		return kNaN;
	}
	if (statistic > kTauMax) {
		return 1.0;
	}
	if (statistic < kTauMin) {
		return 0.0;
	}
	const double z = statistic <= kTauStar ? polynomial(kSmallP, statistic) : polynomial(kLargeP, statistic);
	return utils::Distributions::normalCdf(z);
}

std::map<std::string, double> AugmentedDickeyFuller::criticalValues(std::size_t nobs) {
	const double inv = 1.0 / static_cast<double>(nobs);
	return {{"1%", polynomial(kCrit1, inv)}, {"5%", polynomial(kCrit5, inv)}, {"10%", polynomial(kCrit10, inv)}};
}

AdfResult AugmentedDickeyFuller::test(const std::vector<double> &data) const {
	const auto x = utils::Statistics::finiteValues(data);
	const std::size_t n = x.size();
	if (n < kMinObservations) {
		throw std::invalid_argument("ADF test requires at least " + std::to_string(kMinObservations) +
		                            " observations, got " + std::to_string(n) + ".");
	}

	const std::size_t lag_cap = n / 2 - 2;
	std::size_t max_lag = static_cast<std::size_t>(std::ceil(12.0 * std::pow(static_cast<double>(n) / 100.0, 0.25)));
	max_lag = std::min(max_lag, lag_cap);
	if (max_lag_) {
		if (*max_lag_ > lag_cap) {
			throw std::invalid_argument("ADF lag " + std::to_string(*max_lag_) + " exceeds the maximum of " +
			                            std::to_string(lag_cap) + " for " + std::to_string(n) + " observations.");
		}
		max_lag = *max_lag_;
	}

	AdfResult result;
	if (utils::Statistics::variance(x, 0) == 0.0) {
		DEMANDSTATS_WARN("ADF test on a constant series is undefined; reporting NaN statistic");
		result.statistic = kNaN;
		result.p_value = kNaN;
		result.ic_best = kNaN;
		result.nobs = n - 1;
		result.critical_values = criticalValues(result.nobs);
		return result;
	}

	const auto dx = utils::Statistics::diff(x);
	std::size_t lag = max_lag;
	result.ic_best = kNaN;
	if (selection_ != LagSelection::Fixed) {
		// Every candidate is fitted on the same sample, the one usable at max_lag.
		Eigen::MatrixXd full_design;
		Eigen::VectorXd response;
		buildDesign(x, dx, max_lag, max_lag, full_design, response);
		double best = std::numeric_limits<double>::infinity();
		for (std::size_t candidate = 0; candidate <= max_lag; ++candidate) {
			const auto fit = utils::OrdinaryLeastSquares::fit(
			    full_design.leftCols(static_cast<Eigen::Index>(candidate + 2)), response);
			const double ic = selection_ == LagSelection::Aic ? fit.aic : fit.bic;
			if (ic < best) {
				best = ic;
				lag = candidate;
			}
		}
		result.ic_best = best;
		DEMANDSTATS_DEBUG("ADF lag search over 0..{} selected lag {}", max_lag, lag);
	}

	Eigen::MatrixXd design;
	Eigen::VectorXd response;
	buildDesign(x, dx, lag, lag, design, response);
	const auto fit = utils::OrdinaryLeastSquares::fit(design, response);

	result.used_lag = lag;
	result.nobs = fit.nobs;
	result.statistic = fit.t_values(1);
	result.p_value = mackinnonPValue(result.statistic);
	result.critical_values = criticalValues(result.nobs);
	result.is_stationary = result.p_value < alpha_;

	DEMANDSTATS_DEBUG("ADF statistic {:.4f}, p-value {:.4g}, lag {}, nobs {}", result.statistic, result.p_value,
	                  result.used_lag, result.nobs);
	return result;
}

} // namespace demandstats::stationarity
