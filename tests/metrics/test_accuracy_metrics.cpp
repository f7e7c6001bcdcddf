#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/core/forecast_pair.hpp"
#include "demand-stats/metrics/accuracy_metrics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using demandstats::core::ActualForecastPair;
using demandstats::metrics::AccuracyMetricsEngine;

TEST_CASE("Accuracy metrics on a small demand sample", "[metrics][accuracy]") {
	const std::vector<double> actual {100.0, 110.0, 90.0, 105.0};
	const std::vector<double> forecast {95.0, 115.0, 85.0, 100.0};

	const auto metrics = AccuracyMetricsEngine::compute(ActualForecastPair(actual, forecast));

	REQUIRE(metrics.n == 4);
	REQUIRE(metrics.mae == Catch::Approx(5.0));
	REQUIRE(metrics.bias == Catch::Approx(-2.5));
	REQUIRE(metrics.mse == Catch::Approx(25.0));
	REQUIRE(metrics.rmse == Catch::Approx(5.0));
	REQUIRE(metrics.mape == Catch::Approx(4.965729).margin(1e-5));
	REQUIRE(metrics.wape == Catch::Approx(4.938272).margin(1e-5));
	REQUIRE(metrics.smape == Catch::Approx(5.041246).margin(1e-5));

	const auto as_map = metrics.asMap();
	REQUIRE(as_map.size() == 7);
	REQUIRE(as_map.at("mae") == Catch::Approx(5.0));
	REQUIRE(as_map.at("wape") == Catch::Approx(metrics.wape));
}

TEST_CASE("Perfect forecasts score zero on every metric", "[metrics][accuracy]") {
	const std::vector<double> actual {12.0, 7.5, 30.0, 4.0, 18.0};

	const auto metrics = AccuracyMetricsEngine::compute(actual, actual);

	for (const auto &entry : metrics.asMap()) {
		INFO(entry.first);
		REQUIRE(entry.second == Catch::Approx(0.0).margin(1e-12));
	}
}

TEST_CASE("Swapping actual and forecast negates bias only", "[metrics][accuracy]") {
	const ActualForecastPair pair({120.0, 80.0, 95.0, 150.0}, {100.0, 90.0, 99.0, 160.0});

	const auto forward = AccuracyMetricsEngine::compute(pair);
	const auto backward = AccuracyMetricsEngine::compute(pair.swapped());

	REQUIRE(backward.bias == Catch::Approx(-forward.bias));
	REQUIRE(backward.mae == Catch::Approx(forward.mae));
	REQUIRE(backward.rmse == Catch::Approx(forward.rmse));
	REQUIRE(backward.mse == Catch::Approx(forward.mse));
}

TEST_CASE("WAPE equals MAPE when every actual is the same", "[metrics][accuracy]") {
	const std::vector<double> actual(6, 50.0);
	const std::vector<double> forecast {45.0, 52.0, 61.0, 50.0, 38.0, 49.0};

	REQUIRE(AccuracyMetricsEngine::wape(actual, forecast) ==
	        Catch::Approx(AccuracyMetricsEngine::mape(actual, forecast)));
}

TEST_CASE("Percentage metrics skip zero actuals", "[metrics][accuracy][zero]") {
	SECTION("Zero actuals are excluded from MAPE") {
		const std::vector<double> actual {0.0, 100.0};
		const std::vector<double> forecast {10.0, 90.0};
		REQUIRE(AccuracyMetricsEngine::mape(actual, forecast) == Catch::Approx(10.0));
		REQUIRE(AccuracyMetricsEngine::wape(actual, forecast) == Catch::Approx(20.0));
	}

	SECTION("All-zero actuals leave MAPE and WAPE undefined") {
		const std::vector<double> actual {0.0, 0.0, 0.0};
		const std::vector<double> forecast {1.0, 2.0, 0.0};
		const auto metrics = AccuracyMetricsEngine::compute(actual, forecast);
		REQUIRE(std::isnan(metrics.mape));
		REQUIRE(std::isnan(metrics.wape));
		REQUIRE(metrics.smape == Catch::Approx(200.0));
		REQUIRE(metrics.mae == Catch::Approx(1.0));
	}
}

TEST_CASE("Accuracy metrics reject invalid inputs", "[metrics][accuracy][error]") {
	const std::vector<double> actual {1.0, 2.0};
	const std::vector<double> forecast {1.0};

	REQUIRE_THROWS_AS(AccuracyMetricsEngine::compute(actual, forecast), std::invalid_argument);
	REQUIRE_THROWS_AS(AccuracyMetricsEngine::mape(actual, forecast), std::invalid_argument);
	REQUIRE_THROWS_AS(AccuracyMetricsEngine::compute({}, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(ActualForecastPair(actual, forecast), std::invalid_argument);
}
