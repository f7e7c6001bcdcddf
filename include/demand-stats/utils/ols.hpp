#pragma once

#include <Eigen/Dense>
#include <cstddef>

namespace demandstats::utils {

/**
 * @brief Fitted ordinary least squares regression y = X * beta + e.
 *
 * Standard errors use the unbiased residual variance ssr / (nobs - k). The
 * log-likelihood and information criteria follow the Gaussian likelihood with
 * the maximum-likelihood variance ssr / nobs.
 */
struct OlsResult {
	Eigen::VectorXd params;
	Eigen::VectorXd standard_errors;
	Eigen::VectorXd t_values;
	double ssr = 0.0;
	double log_likelihood = 0.0;
	double aic = 0.0;
	double bic = 0.0;
	double r_squared = 0.0;
	std::size_t nobs = 0;
	std::size_t rank = 0;

	bool isFullRank() const {
		return rank == static_cast<std::size_t>(params.size());
	}
};

class OrdinaryLeastSquares final {
public:
	/**
	 * @throws std::invalid_argument If the design has no columns, the row counts of
	 *         X and y differ, or there are not more observations than columns.
	 */
	static OlsResult fit(const Eigen::MatrixXd &design, const Eigen::VectorXd &response);
};

} // namespace demandstats::utils
