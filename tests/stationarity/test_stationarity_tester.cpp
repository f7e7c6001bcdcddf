#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/stationarity/tester.hpp"
#include "common/series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using demandstats::core::TimeSeries;
using demandstats::stationarity::KpssTest;
using demandstats::stationarity::StationarityTester;

TEST_CASE("Combined verdict for white noise", "[stationarity][tester]") {
	const auto tester = StationarityTester::builder().build();
	auto data = tests::helpers::noise(200, 42);

	const auto verdict = tester.test(data);
	REQUIRE(verdict.adf_stationary);
	REQUIRE(verdict.kpss_stationary);
	REQUIRE(verdict.is_stationary);
	REQUIRE(verdict.interpretation() == "stationary");
	REQUIRE(verdict.adf_statistic == verdict.adf.statistic);
	REQUIRE(verdict.kpss_p_value == verdict.kpss.p_value);

	SECTION("missing values are dropped") {
		data.insert(data.begin() + 50, std::numeric_limits<double>::quiet_NaN());
		const auto gappy = tester.test(TimeSeries(data));
		REQUIRE(gappy.adf.nobs == verdict.adf.nobs);
		REQUIRE(gappy.is_stationary);
	}
}

TEST_CASE("Tests disagree on a random walk", "[stationarity][tester]") {
	const auto verdict = StationarityTester::builder().build().test(tests::helpers::randomWalk(200, 42));

	REQUIRE_FALSE(verdict.adf_stationary);
	REQUIRE(verdict.kpss_stationary);
	REQUIRE_FALSE(verdict.is_stationary);
	REQUIRE(verdict.interpretation() == "trend-stationary");
}

TEST_CASE("Both tests flag a trending series", "[stationarity][tester]") {
	auto data = tests::helpers::noise(120, 11);
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] += 0.5 * static_cast<double>(i);
	}

	const auto verdict = StationarityTester::builder().build().test(data);
	REQUIRE_FALSE(verdict.adf_stationary);
	REQUIRE_FALSE(verdict.kpss_stationary);
	REQUIRE(verdict.interpretation() == "non-stationary");
}

TEST_CASE("Differencing recommendation", "[stationarity][tester][differencing]") {
	const auto tester = StationarityTester::builder().build();

	SECTION("stationary input needs no differencing") {
		const auto recommendation = tester.recommendDifferencing(tests::helpers::noise(200, 42));
		REQUIRE(recommendation.stationary_found);
		REQUIRE(recommendation.order == 0);
		REQUIRE(recommendation.verdicts.size() == 1);
	}

	SECTION("a random walk needs one difference") {
		const auto recommendation = tester.recommendDifferencing(tests::helpers::randomWalk(200, 2024));
		REQUIRE(recommendation.stationary_found);
		REQUIRE(recommendation.order == 1);
		REQUIRE(recommendation.verdicts.size() == 2);
		REQUIRE_FALSE(recommendation.verdicts.front().is_stationary);
		REQUIRE(recommendation.verdicts.back().is_stationary);
	}

	SECTION("a timestamped series with gaps is cleaned before differencing") {
		const auto walk = tests::helpers::randomWalk(200, 2024);
		std::vector<double> gappy {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN()};
		gappy.insert(gappy.end(), walk.begin(), walk.end());

		std::vector<TimeSeries::TimePoint> stamps;
		for (std::size_t i = 0; i < gappy.size(); ++i) {
			stamps.push_back(TimeSeries::TimePoint {} + std::chrono::hours(24 * static_cast<int>(i)));
		}

		const auto recommendation = tester.recommendDifferencing(TimeSeries(stamps, gappy));
		REQUIRE(recommendation.order == 1);
		REQUIRE(recommendation.verdicts.size() == 2);
		REQUIRE(recommendation.verdicts.back().adf_statistic ==
		        Catch::Approx(tester.recommendDifferencing(walk).verdicts.back().adf_statistic));
	}

	SECTION("short input stops before the series runs out") {
		const auto recommendation = tester.recommendDifferencing({1.0, 4.0, 2.0, 8.0, 3.0}, 3);
		REQUIRE(recommendation.verdicts.size() <= 2);
		if (!recommendation.stationary_found) {
			REQUIRE(recommendation.order == 3);
		}
	}
}

TEST_CASE("Tester edge cases", "[stationarity][tester][error]") {
	const auto tester = StationarityTester::builder()
	                        .withKpss(KpssTest::builder().withSignificance(0.1).build())
	                        .build();
	REQUIRE(StationarityTester::minObservations() == 4);

	const auto constant = tester.test(std::vector<double>(20, 1.0));
	REQUIRE(std::isnan(constant.adf_statistic));
	REQUIRE(std::isnan(constant.kpss_statistic));
	REQUIRE_FALSE(constant.is_stationary);
	REQUIRE(constant.interpretation() == "undefined");

	const double nan = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(tester.test({1.0, nan, 2.0, 3.0}), std::invalid_argument);
}
