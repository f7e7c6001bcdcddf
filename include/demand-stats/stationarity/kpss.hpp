#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace demandstats::stationarity {

enum class KpssRegression { Level, Trend };

/**
 * @brief Outcome of a KPSS test.
 *
 * The null hypothesis is stationarity around a level (or trend); the p-value
 * is interpolated from the published table and therefore lies in [0.01, 0.10].
 */
struct KpssResult {
	double statistic = 0.0;
	double p_value = 0.1;
	std::size_t lags = 0;
	std::size_t nobs = 0;
	/// Keys "10%", "5%", "2.5%", "1%".
	std::map<std::string, double> critical_values;
	bool is_stationary = false;
};

/**
 * @class KpssTest
 * @brief Kwiatkowski-Phillips-Schmidt-Shin test with a Bartlett-kernel long-run
 *        variance. The bandwidth defaults to the Hobijn et al. (1998) automatic rule.
 */
class KpssTest {
public:
	static constexpr std::size_t kMinObservations = 3;

	class Builder {
	public:
		Builder &withRegression(KpssRegression regression);
		/// Fixed number of autocovariance lags instead of the automatic rule.
		Builder &withLags(std::size_t lags);
		Builder &withSignificance(double alpha);
		/// @throws std::invalid_argument If the significance is outside (0, 1).
		KpssTest build() const;

	private:
		KpssRegression regression_ = KpssRegression::Level;
		std::optional<std::size_t> lags_;
		double alpha_ = 0.05;
	};

	static Builder builder();

	/**
	 * @brief Runs the test on the finite values of @p data.
	 * @throws std::invalid_argument If fewer than kMinObservations remain or a fixed
	 *         lag count is not below the sample size.
	 */
	KpssResult test(const std::vector<double> &data) const;

	/// Interpolates the table p-value for @p statistic, clamped to [0.01, 0.10].
	static double pValue(double statistic, KpssRegression regression);

private:
	KpssTest(KpssRegression regression, std::optional<std::size_t> lags, double alpha);

	KpssRegression regression_;
	std::optional<std::size_t> lags_;
	double alpha_;
};

} // namespace demandstats::stationarity
