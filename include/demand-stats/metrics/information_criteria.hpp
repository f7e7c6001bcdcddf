#pragma once

#include <cstddef>
#include <vector>

namespace demandstats::metrics {

struct InformationCriteria {
	double aic = 0.0;
	double bic = 0.0;
	double hqic = 0.0;
};

/**
 * @brief AIC, BIC and HQIC from model residuals using the n * ln(SSE / n) form.
 *
 * A perfect fit (SSE = 0) yields negative infinity for all three.
 *
 * @throws std::invalid_argument If fewer than two residuals are given.
 */
InformationCriteria informationCriteria(const std::vector<double> &residuals, std::size_t n_params);

} // namespace demandstats::metrics
