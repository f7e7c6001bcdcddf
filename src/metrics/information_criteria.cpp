#include "demand-stats/metrics/information_criteria.hpp"

#include "demand-stats/utils/logging.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::metrics {

InformationCriteria informationCriteria(const std::vector<double> &residuals, std::size_t n_params) {
	if (residuals.size() < 2) {
		throw std::invalid_argument("Information criteria require at least two residuals.");
	}
	const double n = static_cast<double>(residuals.size());
	const double k = static_cast<double>(n_params);

	double sse = 0.0;
	for (double r : residuals) {
		sse += r * r;
	}

	InformationCriteria criteria;
	if (sse == 0.0) {
		DEMANDSTATS_DEBUG("Residuals are all zero; information criteria diverge to -inf");
		criteria.aic = -std::numeric_limits<double>::infinity();
		criteria.bic = criteria.aic;
		criteria.hqic = criteria.aic;
		return criteria;
	}

	const double fit = n * std::log(sse / n);
	criteria.aic = fit + 2.0 * k;
	criteria.bic = fit + k * std::log(n);
	criteria.hqic = fit + 2.0 * k * std::log(std::log(n));
	return criteria;
}

} // namespace demandstats::metrics
