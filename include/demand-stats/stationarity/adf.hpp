#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace demandstats::stationarity {

enum class LagSelection { Aic, Bic, Fixed };

/**
 * @brief Outcome of an augmented Dickey-Fuller test with a constant.
 *
 * The null hypothesis is a unit root; small p-values indicate stationarity.
 * Statistics are NaN for a constant series.
 */
struct AdfResult {
	double statistic = 0.0;
	double p_value = 1.0;
	std::size_t used_lag = 0;
	std::size_t nobs = 0;
	/// Keys "1%", "5%", "10%".
	std::map<std::string, double> critical_values;
	/// Best information criterion of the lag search; NaN for a fixed lag.
	double ic_best = 0.0;
	bool is_stationary = false;
};

/**
 * @class AugmentedDickeyFuller
 * @brief Unit-root test regressing diff(x) on a constant, the lagged level and
 *        lagged differences.
 *
 * The default maximum lag is ceil(12 * (n / 100)^(1/4)), capped at n / 2 - 2.
 */
class AugmentedDickeyFuller {
public:
	static constexpr std::size_t kMinObservations = 4;

	class Builder {
	public:
		Builder &withAutolag(LagSelection selection);
		/// Upper bound of the lag search, or the lag itself with LagSelection::Fixed.
		Builder &withMaxLag(std::size_t max_lag);
		Builder &withSignificance(double alpha);
		/// @throws std::invalid_argument If the significance is outside (0, 1).
		AugmentedDickeyFuller build() const;

	private:
		LagSelection selection_ = LagSelection::Aic;
		std::optional<std::size_t> max_lag_;
		double alpha_ = 0.05;
	};

	static Builder builder();

	/**
	 * @brief Runs the test on the finite values of @p data.
	 * @throws std::invalid_argument If fewer than kMinObservations remain or the
	 *         requested lag does not fit the sample.
	 */
	AdfResult test(const std::vector<double> &data) const;

	/// MacKinnon (1994) approximate p-value for the constant-only statistic.
	static double mackinnonPValue(double statistic);

	/// MacKinnon (2010) finite-sample critical values for @p nobs observations.
	static std::map<std::string, double> criticalValues(std::size_t nobs);

private:
	AugmentedDickeyFuller(LagSelection selection, std::optional<std::size_t> max_lag, double alpha);

	LagSelection selection_;
	std::optional<std::size_t> max_lag_;
	double alpha_;
};

} // namespace demandstats::stationarity
