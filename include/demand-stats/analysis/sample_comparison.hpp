#pragma once

#include <string>
#include <utility>
#include <vector>

namespace demandstats::analysis {

enum class ComparisonTest { StudentT, MannWhitney, KolmogorovSmirnov };

std::string toString(ComparisonTest test);

struct ComparisonResult {
	ComparisonTest test = ComparisonTest::StudentT;
	double statistic = 0.0;
	double p_value = 1.0;
	bool is_significant = false;
	/// ("p < 0.001", flag) ... ("p < 0.10", flag), strictest first.
	std::vector<std::pair<std::string, bool>> significance_levels;
	/// Cohen's d of sample1 against sample2 using the pooled sample standard deviation.
	double effect_size = 0.0;
};

/**
 * @brief Two-sample location and distribution tests.
 *
 * Every sample must hold at least two values; otherwise the functions throw
 * std::invalid_argument.
 */
namespace SampleComparison {

ComparisonResult compare(const std::vector<double> &sample1, const std::vector<double> &sample2,
                         ComparisonTest test = ComparisonTest::StudentT, double significance = 0.05);

/// Pooled-variance Student t-test, two-sided.
ComparisonResult studentT(const std::vector<double> &sample1, const std::vector<double> &sample2,
                          double significance = 0.05);

/// Mann-Whitney U (statistic U of sample1), normal approximation with tie and continuity correction.
ComparisonResult mannWhitney(const std::vector<double> &sample1, const std::vector<double> &sample2,
                             double significance = 0.05);

/// Two-sample Kolmogorov-Smirnov D, asymptotic p-value with Stephens' correction.
ComparisonResult kolmogorovSmirnov(const std::vector<double> &sample1, const std::vector<double> &sample2,
                                   double significance = 0.05);

double cohensD(const std::vector<double> &sample1, const std::vector<double> &sample2);

/// Survival function of the Kolmogorov distribution, P(K > lambda).
double kolmogorovSurvival(double lambda);

} // namespace SampleComparison
} // namespace demandstats::analysis
