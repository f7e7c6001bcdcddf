#include "demand-stats/utils/ols.hpp"

#include "demand-stats/utils/logging.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::utils {

namespace {

constexpr double kLog2Pi = 1.8378770664093454835606594728112;

} // namespace

OlsResult OrdinaryLeastSquares::fit(const Eigen::MatrixXd &design, const Eigen::VectorXd &response) {
	const auto nobs = design.rows();
	const auto k = design.cols();
	if (k == 0) {
		throw std::invalid_argument("OLS design matrix must have at least one column.");
	}
	if (nobs != response.size()) {
		throw std::invalid_argument("OLS design matrix and response must have the same number of rows.");
	}
	if (nobs <= k) {
		throw std::invalid_argument("OLS requires more observations than regressors.");
	}

	OlsResult result;
	result.nobs = static_cast<std::size_t>(nobs);

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
	result.rank = static_cast<std::size_t>(qr.rank());
	result.params = qr.solve(response);

	const Eigen::VectorXd residuals = response - design * result.params;
	result.ssr = residuals.squaredNorm();

	const double n = static_cast<double>(nobs);
	result.log_likelihood = -0.5 * n * (kLog2Pi + std::log(result.ssr / n) + 1.0);
	result.aic = -2.0 * result.log_likelihood + 2.0 * static_cast<double>(k);
	result.bic = -2.0 * result.log_likelihood + std::log(n) * static_cast<double>(k);

	const double centered_tss = (response.array() - response.mean()).matrix().squaredNorm();
	result.r_squared = centered_tss > 0.0 ? 1.0 - result.ssr / centered_tss : 0.0;

	if (!result.isFullRank()) {
		DEMANDSTATS_DEBUG("OLS design is rank deficient (rank {} of {}); standard errors undefined", result.rank, k);
		result.standard_errors = Eigen::VectorXd::Constant(k, std::numeric_limits<double>::quiet_NaN());
		result.t_values = result.standard_errors;
		return result;
	}

	const double sigma2 = result.ssr / static_cast<double>(nobs - k);
	const Eigen::MatrixXd xtx_inverse = (design.transpose() * design).inverse();
	result.standard_errors = (sigma2 * xtx_inverse.diagonal().array()).sqrt().matrix();
	result.t_values.resize(k);
	for (Eigen::Index i = 0; i < k; ++i) {
		const double se = result.standard_errors(i);
		if (se > 0.0) {
			result.t_values(i) = result.params(i) / se;
		} else if (result.params(i) == 0.0) {
			result.t_values(i) = 0.0;
		} else {
			result.t_values(i) = std::copysign(std::numeric_limits<double>::infinity(), result.params(i));
		}
	}
	return result;
}

} // namespace demandstats::utils
