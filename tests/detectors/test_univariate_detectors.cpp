#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/detectors/iqr.hpp"
#include "demand-stats/detectors/mad.hpp"
#include "demand-stats/detectors/zscore.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using demandstats::core::TimeSeries;
using namespace demandstats::detectors;

namespace {

TimeSeries spikedSeries() {
	return TimeSeries({10.0, 11.0, 9.0, 10.0, 12.0, 10.0, 11.0, 9.0, 10.0, 50.0});
}

} // namespace

TEST_CASE("Z-score detector is masked by the spike it measures", "[detectors][zscore]") {
	const auto series = spikedSeries();

	auto strict = ZScoreDetectorBuilder().build();
	REQUIRE(strict->getName() == "ZScoreDetector");
	REQUIRE(strict->threshold() == Catch::Approx(3.0));
	const auto none = strict->detect(series);
	REQUIRE(none.count() == 0);
	REQUIRE(none.scores[9] == Catch::Approx(2.992073).margin(1e-5));

	auto loose = ZScoreDetectorBuilder().withThreshold(2.5).build();
	const auto flagged = loose->detect(series);
	REQUIRE(flagged.outlier_indices == std::vector<std::size_t> {9});
	REQUIRE(flagged.flags[9]);
	REQUIRE(flagged.percentage() == Catch::Approx(10.0));
}

TEST_CASE("IQR detector uses Tukey fences", "[detectors][iqr]") {
	auto detector = IQRDetectorBuilder().build();
	REQUIRE(detector->multiplier() == Catch::Approx(1.5));

	const auto result = detector->detect(spikedSeries());
	REQUIRE(result.outlier_indices == std::vector<std::size_t> {9});
	REQUIRE(result.scores[9] == Catch::Approx(39.0));
	REQUIRE(result.scores[0] == Catch::Approx(0.0));

	SECTION("Wider fences tolerate more") {
		auto lenient = IQRDetectorBuilder().withMultiplier(40.0).build();
		REQUIRE(lenient->detect(spikedSeries()).count() == 0);
	}

	REQUIRE_THROWS_AS(IQRDetectorBuilder().withMultiplier(-1.0).build(), std::invalid_argument);
}

TEST_CASE("MAD detector scores robustly", "[detectors][mad]") {
	auto detector = MADDetectorBuilder().build();
	REQUIRE(detector->threshold() == Catch::Approx(3.5));

	const auto result = detector->detect(spikedSeries());
	REQUIRE(result.outlier_indices == std::vector<std::size_t> {9});
	REQUIRE(result.scores[9] == Catch::Approx(26.98));
	REQUIRE(result.scores[4] == Catch::Approx(1.349));

	REQUIRE_THROWS_AS(MADDetectorBuilder().withThreshold(0.0).build(), std::invalid_argument);
}

TEST_CASE("Detectors find nothing in a constant series", "[detectors][constant]") {
	const TimeSeries flat(std::vector<double>(12, 7.0));

	REQUIRE(ZScoreDetectorBuilder().build()->detect(flat).count() == 0);
	REQUIRE(IQRDetectorBuilder().build()->detect(flat).count() == 0);
	REQUIRE(MADDetectorBuilder().build()->detect(flat).count() == 0);
}

TEST_CASE("Detectors never flag missing values", "[detectors][missing]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const TimeSeries gappy({10.0, 11.0, nan, 9.0, 10.0, 12.0, 10.0, 11.0, 9.0, 10.0, 50.0});

	const auto iqr = IQRDetectorBuilder().build()->detect(gappy);
	REQUIRE(iqr.flags.size() == 11);
	REQUIRE_FALSE(iqr.flags[2]);
	REQUIRE(std::isnan(iqr.scores[2]));
	REQUIRE(iqr.outlier_indices == std::vector<std::size_t> {10});

	const auto mad = MADDetectorBuilder().build()->detect(gappy);
	REQUIRE_FALSE(mad.flags[2]);
	REQUIRE(mad.outlier_indices == std::vector<std::size_t> {10});

	const TimeSeries empty(std::vector<double> {});
	REQUIRE(ZScoreDetectorBuilder().build()->detect(empty).flags.empty());
}
