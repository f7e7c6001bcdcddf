#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/core/forecast_pair.hpp"
#include "demand-stats/core/time_series.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>
#include <vector>

using demandstats::core::ActualForecastPair;
using demandstats::core::TimeSeries;

namespace {

std::vector<TimeSeries::TimePoint> dailyTimestamps(std::size_t count) {
	const auto start = TimeSeries::TimePoint {} + std::chrono::hours(24 * 19000);
	std::vector<TimeSeries::TimePoint> stamps;
	stamps.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		stamps.push_back(start + std::chrono::hours(24 * static_cast<int>(i)));
	}
	return stamps;
}

} // namespace

TEST_CASE("TimeSeries holds values with an implicit index", "[core][time_series]") {
	const TimeSeries series({3.0, 5.0, 4.0}, "demand");

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.isEmpty());
	REQUIRE_FALSE(series.hasTimestamps());
	REQUIRE(series.label() == "demand");
	REQUIRE(series[1] == Catch::Approx(5.0));
	REQUIRE(series.at(2) == Catch::Approx(4.0));
	REQUIRE_THROWS_AS(series.at(3), std::out_of_range);
	REQUIRE(series.timeAxis() == std::vector<double> {0.0, 1.0, 2.0});
}

TEST_CASE("TimeSeries validates timestamps", "[core][time_series]") {
	auto stamps = dailyTimestamps(3);

	REQUIRE_THROWS_AS(TimeSeries(stamps, {1.0, 2.0}), std::invalid_argument);

	auto repeated = stamps;
	repeated[2] = repeated[1];
	REQUIRE_THROWS_AS(TimeSeries(repeated, {1.0, 2.0, 3.0}), std::invalid_argument);

	const TimeSeries series(stamps, {1.0, 2.0, 3.0});
	REQUIRE(series.hasTimestamps());
	const auto axis = series.timeAxis();
	REQUIRE(axis[0] == Catch::Approx(0.0));
	REQUIRE(axis[2] == Catch::Approx(2.0 * 86400.0));
}

TEST_CASE("TimeSeries missing values and differencing", "[core][time_series]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const TimeSeries gappy(dailyTimestamps(4), {1.0, nan, 4.0, 9.0});

	REQUIRE(gappy.hasMissingValues());
	const auto cleaned = gappy.dropMissing();
	REQUIRE(cleaned.size() == 3);
	REQUIRE(cleaned.getTimestamps().size() == 3);
	REQUIRE_FALSE(cleaned.hasMissingValues());
	REQUIRE(cleaned.getTimestamps()[1] == gappy.getTimestamps()[2]);

	const TimeSeries squares({1.0, 4.0, 9.0, 16.0, 25.0});
	const auto first = squares.differenced();
	REQUIRE(first.getValues() == std::vector<double> {3.0, 5.0, 7.0, 9.0});
	const auto second = squares.differenced(2);
	REQUIRE(second.getValues() == std::vector<double> {2.0, 2.0, 2.0});
	REQUIRE_THROWS_AS(squares.differenced(5), std::invalid_argument);
}

TEST_CASE("ActualForecastPair enforces aligned inputs", "[core][forecast_pair]") {
	const ActualForecastPair pair({10.0, 20.0}, {12.0, 18.0});
	REQUIRE(pair.size() == 2);
	REQUIRE(pair.actual()[0] == Catch::Approx(10.0));
	REQUIRE(pair.swapped().actual()[0] == Catch::Approx(12.0));

	REQUIRE_THROWS_AS(ActualForecastPair({}, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(ActualForecastPair({1.0}, {1.0, 2.0}), std::invalid_argument);
}
