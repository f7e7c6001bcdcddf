#include "demand-stats/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace demandstats::utils::Statistics {

namespace {

void requireNonEmpty(const std::vector<double> &data, const char *operation) {
	if (data.empty()) {
		throw std::invalid_argument(std::string(operation) + " requires at least one observation.");
	}
}

} // namespace

double mean(const std::vector<double> &data) {
	requireNonEmpty(data, "mean");
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double> &data, std::size_t ddof) {
	if (data.size() <= ddof) {
		throw std::invalid_argument("variance requires more observations than delta degrees of freedom.");
	}
	const double m = mean(data);
	double sum_sq = 0.0;
	for (double value : data) {
		const double d = value - m;
		sum_sq += d * d;
	}
	return sum_sq / static_cast<double>(data.size() - ddof);
}

double stddev(const std::vector<double> &data, std::size_t ddof) {
	return std::sqrt(variance(data, ddof));
}

double nanVariance(const std::vector<double> &data) {
	const auto finite = finiteValues(data);
	if (finite.empty()) {
		return 0.0;
	}
	return variance(finite, 0);
}

double percentile(std::vector<double> data, double q) {
	requireNonEmpty(data, "percentile");
	if (!(q >= 0.0 && q <= 100.0)) {
		throw std::invalid_argument("percentile requires q in [0, 100].");
	}
	std::sort(data.begin(), data.end());
	const double position = (q / 100.0) * static_cast<double>(data.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, data.size() - 1);
	const double fraction = position - static_cast<double>(lower);
	return data[lower] + fraction * (data[upper] - data[lower]);
}

double median(std::vector<double> data) {
	return percentile(std::move(data), 50.0);
}

std::vector<double> finiteValues(const std::vector<double> &data) {
	std::vector<double> result;
	result.reserve(data.size());
	std::copy_if(data.begin(), data.end(), std::back_inserter(result), [](double v) { return std::isfinite(v); });
	return result;
}

std::vector<double> diff(const std::vector<double> &data) {
	if (data.size() < 2) {
		return {};
	}
	std::vector<double> result(data.size() - 1);
	for (std::size_t i = 1; i < data.size(); ++i) {
		result[i - 1] = data[i] - data[i - 1];
	}
	return result;
}

} // namespace demandstats::utils::Statistics
