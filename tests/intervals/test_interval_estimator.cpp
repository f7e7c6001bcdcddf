#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/intervals/interval_estimator.hpp"

#include <random>
#include <stdexcept>
#include <vector>

using demandstats::intervals::Interval;
using demandstats::intervals::IntervalEstimator;

namespace {

const std::vector<double> kSample {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0};

} // namespace

TEST_CASE("Student-t confidence interval for the mean", "[intervals][confidence]") {
	const auto interval = IntervalEstimator::confidenceInterval(kSample, 0.95);

	REQUIRE(interval.confidence_level == Catch::Approx(0.95));
	REQUIRE(interval.lower == Catch::Approx(3.334149).margin(1e-5));
	REQUIRE(interval.upper == Catch::Approx(7.665851).margin(1e-5));
	REQUIRE(interval.contains(5.5));

	const auto narrower = IntervalEstimator::confidenceInterval(kSample, 0.8);
	REQUIRE(narrower.width() < interval.width());
}

TEST_CASE("Bootstrap interval is reproducible and nested", "[intervals][bootstrap]") {
	const std::vector<double> data {12.0, 15.0, 9.0, 20.0, 14.0, 11.0, 18.0, 16.0, 13.0, 10.0, 25.0, 8.0};

	SECTION("Same seed gives the same interval") {
		const auto first = IntervalEstimator::bootstrapConfidenceInterval(data, 0.9, 500, 42);
		const auto second = IntervalEstimator::bootstrapConfidenceInterval(data, 0.9, 500, 42);
		REQUIRE(first.lower == second.lower);
		REQUIRE(first.upper == second.upper);
	}

	SECTION("Injected engine drives the resampling") {
		std::mt19937_64 engine(7);
		const auto from_engine = IntervalEstimator::bootstrapConfidenceInterval(data, 0.95, 400, engine);
		const auto from_seed = IntervalEstimator::bootstrapConfidenceInterval(data, 0.95, 400, 7);
		REQUIRE(from_engine.lower == from_seed.lower);
		REQUIRE(from_engine.upper == from_seed.upper);
	}

	SECTION("Width does not shrink as the level rises") {
		double previous_width = 0.0;
		for (double level : {0.5, 0.8, 0.9, 0.95, 0.99}) {
			const auto interval = IntervalEstimator::bootstrapConfidenceInterval(data, level, 1000, 123);
			REQUIRE(interval.lower <= interval.upper);
			REQUIRE(interval.width() >= previous_width);
			previous_width = interval.width();
		}
	}

	SECTION("Bounds stay within the sample range") {
		const auto interval = IntervalEstimator::bootstrapConfidenceInterval(data);
		REQUIRE(interval.lower >= 8.0);
		REQUIRE(interval.upper <= 25.0);
	}
}

TEST_CASE("Prediction interval uses normal or Student-t quantiles", "[intervals][prediction]") {
	const auto normal = IntervalEstimator::predictionInterval(100.0, 10.0, 0.95);
	REQUIRE(normal.lower == Catch::Approx(100.0 - 19.59964).margin(1e-4));
	REQUIRE(normal.upper == Catch::Approx(100.0 + 19.59964).margin(1e-4));

	const auto student = IntervalEstimator::predictionInterval(100.0, 10.0, 0.95, 10);
	REQUIRE(student.upper == Catch::Approx(100.0 + 22.28139).margin(1e-4));
	REQUIRE(student.width() > normal.width());

	const auto degenerate = IntervalEstimator::predictionInterval(42.0, 0.0, 0.9);
	REQUIRE(degenerate.lower == Catch::Approx(42.0));
	REQUIRE(degenerate.upper == Catch::Approx(42.0));
}

TEST_CASE("Forecast interval bands per confidence level", "[intervals][forecast]") {
	const std::vector<double> forecasts {100.0, 110.0, 120.0};
	const std::vector<double> residuals {-2.0, 2.0, -2.0, 2.0};

	const auto bands = IntervalEstimator::forecastIntervals(forecasts, residuals);

	REQUIRE(bands.size() == 3);
	REQUIRE(bands[0].confidence_level == Catch::Approx(0.5));
	REQUIRE(bands[2].confidence_level == Catch::Approx(0.95));
	for (const auto &band : bands) {
		REQUIRE(band.intervals.size() == forecasts.size());
	}
	REQUIRE(bands[2].intervals[1].lower == Catch::Approx(110.0 - 2.0 * 1.959964).margin(1e-5));
	REQUIRE(bands[0].intervals[0].width() < bands[1].intervals[0].width());
	REQUIRE(bands[1].intervals[0].width() < bands[2].intervals[0].width());

	const std::vector<double> actual {101.0, 130.0, 119.0};
	REQUIRE(IntervalEstimator::coverage(actual, bands[2].intervals) == Catch::Approx(2.0 / 3.0));
}

TEST_CASE("Interval estimator rejects invalid inputs", "[intervals][error]") {
	REQUIRE_THROWS_AS(IntervalEstimator::confidenceInterval({1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::confidenceInterval(kSample, 1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::confidenceInterval(kSample, 0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::bootstrapConfidenceInterval({}, 0.9), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::bootstrapConfidenceInterval(kSample, 0.9, 0), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::predictionInterval(1.0, 1.0, 0.95, 0), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::forecastIntervals({1.0}, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::forecastIntervals({1.0}, {1.0}, {1.5}), std::invalid_argument);
	REQUIRE_THROWS_AS(IntervalEstimator::coverage({1.0, 2.0}, {Interval {0.0, 1.0, 0.9}}), std::invalid_argument);
}
