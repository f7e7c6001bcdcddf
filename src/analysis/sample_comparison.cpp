#include "demand-stats/analysis/sample_comparison.hpp"

#include "demand-stats/utils/distributions.hpp"
#include "demand-stats/utils/logging.hpp"
#include "demand-stats/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandstats::analysis {

std::string toString(ComparisonTest test) {
	switch (test) {
	case ComparisonTest::StudentT:
		return "Independent t-test";
	case ComparisonTest::MannWhitney:
		return "Mann-Whitney U test";
	case ComparisonTest::KolmogorovSmirnov:
		return "Kolmogorov-Smirnov test";
	}
	return "Independent t-test";
}

namespace SampleComparison {

namespace {

constexpr double kPi = 3.14159265358979323846;

void validateSamples(const std::vector<double> &sample1, const std::vector<double> &sample2, double significance) {
	if (sample1.size() < 2 || sample2.size() < 2) {
		throw std::invalid_argument("Sample comparison requires at least two values per sample.");
	}
	if (!(significance > 0.0 && significance < 1.0)) {
		throw std::invalid_argument("Significance level must lie strictly between 0 and 1.");
	}
}

ComparisonResult finish(ComparisonTest test, double statistic, double p_value, double significance,
                        const std::vector<double> &sample1, const std::vector<double> &sample2) {
	ComparisonResult result;
	result.test = test;
	result.statistic = statistic;
	result.p_value = p_value;
	result.is_significant = p_value < significance;
	result.significance_levels = {{"p < 0.001", p_value < 0.001},
	                              {"p < 0.01", p_value < 0.01},
	                              {"p < 0.05", p_value < 0.05},
	                              {"p < 0.10", p_value < 0.10}};
	result.effect_size = cohensD(sample1, sample2);
	DEMANDSTATS_DEBUG("{}: statistic {:.4f}, p-value {:.4g}, d={:.3f}", toString(test), statistic, p_value,
	                  result.effect_size);
	return result;
}

double pooledStdDev(const std::vector<double> &sample1, const std::vector<double> &sample2) {
	const double n1 = static_cast<double>(sample1.size());
	const double n2 = static_cast<double>(sample2.size());
	const double pooled = ((n1 - 1.0) * utils::Statistics::variance(sample1, 1) +
	                       (n2 - 1.0) * utils::Statistics::variance(sample2, 1)) /
	                      (n1 + n2 - 2.0);
	return std::sqrt(pooled);
}

} // namespace

double cohensD(const std::vector<double> &sample1, const std::vector<double> &sample2) {
	if (sample1.size() < 2 || sample2.size() < 2) {
		throw std::invalid_argument("Cohen's d requires at least two values per sample.");
	}
	const double pooled = pooledStdDev(sample1, sample2);
	if (pooled == 0.0) {
		return 0.0;
	}
	return (utils::Statistics::mean(sample1) - utils::Statistics::mean(sample2)) / pooled;
}

double kolmogorovSurvival(double lambda) {
	if (std::isnan(lambda)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (lambda <= 0.0) {
		return 1.0;
	}
	// Small lambda: Jacobi theta form of the CDF converges in a few terms.
	if (lambda < 1.18) {
		const double factor = std::sqrt(2.0 * kPi) / lambda;
		const double w = kPi * kPi / (8.0 * lambda * lambda);
		double cdf = 0.0;
		for (int k = 1; k <= 20; ++k) {
			const double odd = 2.0 * k - 1.0;
			cdf += std::exp(-odd * odd * w);
		}
		return std::clamp(1.0 - factor * cdf, 0.0, 1.0);
	}
	double sum = 0.0;
	for (int k = 1; k <= 100; ++k) {
		const double term = std::exp(-2.0 * k * k * lambda * lambda);
		sum += (k % 2 == 1 ? term : -term);
		if (term < 1e-16) {
			break;
		}
	}
	return std::clamp(2.0 * sum, 0.0, 1.0);
}

ComparisonResult studentT(const std::vector<double> &sample1, const std::vector<double> &sample2,
                          double significance) {
	validateSamples(sample1, sample2, significance);
	const double n1 = static_cast<double>(sample1.size());
	const double n2 = static_cast<double>(sample2.size());
	const double diff = utils::Statistics::mean(sample1) - utils::Statistics::mean(sample2);
	const double se = pooledStdDev(sample1, sample2) * std::sqrt(1.0 / n1 + 1.0 / n2);

	double t = 0.0;
	double p = 1.0;
	if (se > 0.0) {
		t = diff / se;
		p = utils::Distributions::studentTTwoSidedPValue(t, n1 + n2 - 2.0);
	} else if (diff != 0.0) {
		DEMANDSTATS_DEBUG("t-test samples have no spread but different means");
		t = std::copysign(std::numeric_limits<double>::infinity(), diff);
		p = 0.0;
	}
	return finish(ComparisonTest::StudentT, t, p, significance, sample1, sample2);
}

ComparisonResult mannWhitney(const std::vector<double> &sample1, const std::vector<double> &sample2,
                             double significance) {
	validateSamples(sample1, sample2, significance);
	const std::size_t n1 = sample1.size();
	const std::size_t n2 = sample2.size();
	const std::size_t n = n1 + n2;

	std::vector<std::pair<double, bool>> pooled;
	pooled.reserve(n);
	for (double v : sample1) {
		pooled.emplace_back(v, true);
	}
	for (double v : sample2) {
		pooled.emplace_back(v, false);
	}
	std::sort(pooled.begin(), pooled.end(),
	          [](const std::pair<double, bool> &a, const std::pair<double, bool> &b) { return a.first < b.first; });

	// Average ranks over ties.
	double rank_sum1 = 0.0;
	double tie_term = 0.0;
	for (std::size_t i = 0; i < n;) {
		std::size_t j = i;
		while (j + 1 < n && pooled[j + 1].first == pooled[i].first) {
			++j;
		}
		const double average_rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
		const double tied = static_cast<double>(j - i + 1);
		tie_term += tied * tied * tied - tied;
		for (std::size_t k = i; k <= j; ++k) {
			if (pooled[k].second) {
				rank_sum1 += average_rank;
			}
		}
		i = j + 1;
	}

	const double dn1 = static_cast<double>(n1);
	const double dn2 = static_cast<double>(n2);
	const double dn = static_cast<double>(n);
	const double u1 = rank_sum1 - dn1 * (dn1 + 1.0) / 2.0;
	const double mu = dn1 * dn2 / 2.0;
	const double sigma = std::sqrt(dn1 * dn2 / 12.0 * ((dn + 1.0) - tie_term / (dn * (dn - 1.0))));

	double p = 1.0;
	if (sigma > 0.0) {
		const double z = (std::abs(u1 - mu) - 0.5) / sigma;
		p = std::min(1.0, 2.0 * (1.0 - utils::Distributions::normalCdf(z)));
	} else {
		DEMANDSTATS_DEBUG("Mann-Whitney samples are entirely tied; p-value set to 1");
	}
	return finish(ComparisonTest::MannWhitney, u1, p, significance, sample1, sample2);
}

ComparisonResult kolmogorovSmirnov(const std::vector<double> &sample1, const std::vector<double> &sample2,
                                   double significance) {
	validateSamples(sample1, sample2, significance);
	std::vector<double> a = sample1;
	std::vector<double> b = sample2;
	std::sort(a.begin(), a.end());
	std::sort(b.begin(), b.end());

	const double na = static_cast<double>(a.size());
	const double nb = static_cast<double>(b.size());
	double d = 0.0;
	std::size_t i = 0;
	std::size_t j = 0;
	while (i < a.size() && j < b.size()) {
		const double value = std::min(a[i], b[j]);
		while (i < a.size() && a[i] == value) {
			++i;
		}
		while (j < b.size() && b[j] == value) {
			++j;
		}
		d = std::max(d, std::abs(static_cast<double>(i) / na - static_cast<double>(j) / nb));
	}

	const double en = std::sqrt(na * nb / (na + nb));
	const double p = kolmogorovSurvival((en + 0.12 + 0.11 / en) * d);
	return finish(ComparisonTest::KolmogorovSmirnov, d, p, significance, sample1, sample2);
}

ComparisonResult compare(const std::vector<double> &sample1, const std::vector<double> &sample2, ComparisonTest test,
                         double significance) {
	switch (test) {
	case ComparisonTest::StudentT:
		return studentT(sample1, sample2, significance);
	case ComparisonTest::MannWhitney:
		return mannWhitney(sample1, sample2, significance);
	case ComparisonTest::KolmogorovSmirnov:
		return kolmogorovSmirnov(sample1, sample2, significance);
	}
	throw std::invalid_argument("Unknown comparison test.");
}

} // namespace SampleComparison
} // namespace demandstats::analysis
