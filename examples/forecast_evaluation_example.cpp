#include "demand-stats/quick.hpp"
#include "demand-stats/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace demandstats;

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<double> synthesizeDemand(std::size_t length) {
	std::mt19937 rng(7);
	std::normal_distribution<double> noise(0.0, 4.0);

	std::vector<double> data;
	data.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		const double weekly = 25.0 * std::sin(2.0 * kPi * static_cast<double>(i % 7) / 7.0);
		double value = 200.0 + 0.4 * static_cast<double>(i) + weekly + noise(rng);
		if (i == 40) {
			value += 120.0; // promotion
		}
		data.push_back(value);
	}
	return data;
}

void printIndices(const std::string &label, const std::vector<std::size_t> &indices) {
	std::cout << label;
	if (indices.empty()) {
		std::cout << " none\n";
		return;
	}
	std::cout << ' ';
	for (std::size_t i = 0; i < indices.size(); ++i) {
		std::cout << indices[i];
		if (i + 1 < indices.size()) {
			std::cout << ", ";
		}
	}
	std::cout << '\n';
}

void printMetric(const char *label, double value) {
	std::cout << "    " << std::setw(8) << label << ": ";
	if (std::isfinite(value)) {
		std::cout << std::fixed << std::setprecision(4) << value << '\n';
	} else {
		std::cout << "n/a\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	const auto history = synthesizeDemand(84);
	const std::vector<double> actual(history.end() - 14, history.end());

	// Naive seasonal forecast: repeat the week before.
	std::vector<double> forecast(history.end() - 21, history.end() - 7);

	std::cout << "=== Forecast Evaluation ===\n";
	const auto accuracy = quick::accuracyMetrics(actual, forecast);
	std::cout << "  Accuracy metrics\n";
	for (const auto &entry : accuracy.asMap()) {
		printMetric(entry.first.c_str(), entry.second);
	}

	const auto bias = quick::forecastBias(forecast, actual);
	std::cout << "  Bias: " << metrics::toString(bias.direction) << " (p=" << bias.p_value << ")"
	          << (bias.is_systematic ? ", systematic" : "") << '\n';

	std::vector<double> residuals(actual.size());
	for (std::size_t i = 0; i < actual.size(); ++i) {
		residuals[i] = actual[i] - forecast[i];
	}
	const auto bands = quick::forecastIntervals(forecast, residuals);
	const auto &widest = bands.back();
	std::cout << "  Coverage of the " << widest.confidence_level * 100.0 << "% band: "
	          << intervals::IntervalEstimator::coverage(actual, widest.intervals) << '\n';

	std::cout << "\n=== Demand Diagnostics ===\n";
	printIndices("Z-score outliers:", quick::detectOutliersZScore(history).outlier_indices);
	printIndices("IQR outliers:", quick::detectOutliersIQR(history).outlier_indices);
	printIndices("MAD outliers:", quick::detectOutliersMAD(history).outlier_indices);

	const auto period = quick::estimateSeasonalPeriod(history);
	std::cout << "Seasonal period: " << period << " ("
	          << seasonality::toString(seasonality::classifyPeriod(static_cast<double>(period))) << ")\n";

	const auto spectral = quick::detectSeasonality(history);
	if (spectral.has_seasonality) {
		std::cout << "Spectral cycles:";
		for (const auto &pattern : spectral.patterns) {
			std::cout << ' ' << seasonality::toString(pattern.type) << " (period " << pattern.period
			          << ", strength " << pattern.strength << ')';
		}
		std::cout << '\n';
	} else {
		std::cout << "Spectral cycles: none\n";
	}

	const auto decomposition = quick::decompose(history);
	std::cout << "Seasonal strength: " << decomposition.seasonal_strength
	          << ", trend strength: " << decomposition.trend_strength << '\n';

	const auto stationarity = quick::testStationarity(history);
	std::cout << "Stationarity: " << stationarity.interpretation() << " (ADF p=" << stationarity.adf_p_value
	          << ", KPSS p=" << stationarity.kpss_p_value << ")\n";
	std::cout << "Recommended differencing order: " << quick::recommendDifferencing(history).order << '\n';

	const auto trend = quick::analyzeTrend(history);
	std::cout << "Trend: " << analysis::toString(trend.direction) << " (slope " << trend.slope << " per day)\n";

	return 0;
}
