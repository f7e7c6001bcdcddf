#include "demand-stats/utils/distributions.hpp"

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::utils::Distributions {

namespace {

void validateProbability(double p) {
	if (!(p > 0.0 && p < 1.0)) {
		throw std::invalid_argument("Probability must lie strictly between 0 and 1.");
	}
}

void validateDegreesOfFreedom(double degrees_of_freedom) {
	if (!(degrees_of_freedom >= 1.0)) {
		throw std::invalid_argument("Degrees of freedom must be at least 1.");
	}
}

} // namespace

double normalQuantile(double p) {
	validateProbability(p);
	const boost::math::normal_distribution<double> standard;
	return boost::math::quantile(standard, p);
}

double normalCdf(double x) {
	if (std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(x)) {
		return x > 0.0 ? 1.0 : 0.0;
	}
	const boost::math::normal_distribution<double> standard;
	return boost::math::cdf(standard, x);
}

double studentTQuantile(double p, double degrees_of_freedom) {
	validateProbability(p);
	validateDegreesOfFreedom(degrees_of_freedom);
	const boost::math::students_t_distribution<double> dist(degrees_of_freedom);
	return boost::math::quantile(dist, p);
}

double studentTCdf(double t, double degrees_of_freedom) {
	validateDegreesOfFreedom(degrees_of_freedom);
	if (std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(t)) {
		return t > 0.0 ? 1.0 : 0.0;
	}
	const boost::math::students_t_distribution<double> dist(degrees_of_freedom);
	return boost::math::cdf(dist, t);
}

double studentTTwoSidedPValue(double t, double degrees_of_freedom) {
	validateDegreesOfFreedom(degrees_of_freedom);
	if (std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(t)) {
		return 0.0;
	}
	const boost::math::students_t_distribution<double> dist(degrees_of_freedom);
	return 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
}

double normalTwoSidedPValue(double z) {
	if (std::isnan(z)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(z)) {
		return 0.0;
	}
	const boost::math::normal_distribution<double> standard;
	return 2.0 * boost::math::cdf(boost::math::complement(standard, std::abs(z)));
}

} // namespace demandstats::utils::Distributions
