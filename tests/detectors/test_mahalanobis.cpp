#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/detectors/mahalanobis.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using demandstats::core::TimeSeries;
using demandstats::detectors::DistanceMode;
using demandstats::detectors::MahalanobisDetectorBuilder;

TEST_CASE("Mahalanobis detector isolates a point far from a correlated cluster", "[detectors][mahalanobis]") {
	const std::vector<std::vector<double>> points {{1.0, 2.0}, {2.0, 1.0}, {2.0, 3.0}, {3.0, 2.0},
	                                               {1.5, 2.5}, {2.5, 1.5}, {2.0, 2.0}, {1.0, 1.0},
	                                               {3.0, 3.0}, {2.2, 1.8}, {20.0, -15.0}};

	auto detector = MahalanobisDetectorBuilder().build();
	REQUIRE(detector->contamination() == Catch::Approx(0.1));
	REQUIRE(detector->mode() == DistanceMode::Auto);

	const auto result = detector->detect(points);
	REQUIRE(result.flags.size() == points.size());
	REQUIRE(result.outlier_indices == std::vector<std::size_t> {10});
	REQUIRE(result.scores[10] > result.threshold);
}

TEST_CASE("Mahalanobis detector falls back to leave-one-out for tiny samples", "[detectors][mahalanobis]") {
	const std::vector<std::vector<double>> points {{0.0, 0.0}, {0.0, 1.0}, {50.0, 50.0}};

	SECTION("Pooled distances are identical and flag nothing") {
		auto pooled = MahalanobisDetectorBuilder().withContamination(1.0 / 3.0).withDistanceMode(DistanceMode::Pooled).build();
		const auto result = pooled->detect(points);
		REQUIRE(result.count() == 0);
		REQUIRE(result.scores[0] == Catch::Approx(result.scores[2]));
	}

	SECTION("Automatic mode separates the far point") {
		auto detector = MahalanobisDetectorBuilder().withContamination(1.0 / 3.0).build();
		const auto result = detector->detect(points);
		REQUIRE(result.outlier_indices == std::vector<std::size_t> {2});
		REQUIRE(result.scores[0] == Catch::Approx(0.7213).margin(1e-3));
		REQUIRE(result.scores[2] == Catch::Approx(70.0).margin(0.1));
	}
}

TEST_CASE("Mahalanobis detector handles univariate series", "[detectors][mahalanobis]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const TimeSeries series({10.0, 11.0, 9.0, nan, 10.0, 12.0, 10.0, 11.0, 9.0, 10.0, 50.0});

	auto detector = MahalanobisDetectorBuilder().build();
	const auto result = detector->detect(series);
	REQUIRE(result.flags.size() == series.size());
	REQUIRE_FALSE(result.flags[3]);
	REQUIRE(result.outlier_indices == std::vector<std::size_t> {10});
}

TEST_CASE("Mahalanobis detector tolerates singular covariance", "[detectors][mahalanobis]") {
	// Second feature is an exact multiple of the first.
	const std::vector<std::vector<double>> collinear {{1.0, 2.0}, {2.0, 4.0}, {3.0, 6.0}, {4.0, 8.0},
	                                                  {5.0, 10.0}, {6.0, 12.0}, {7.0, 14.0}, {8.0, 16.0},
	                                                  {9.0, 18.0}, {30.0, 60.0}};

	auto detector = MahalanobisDetectorBuilder().build();
	const auto result = detector->detect(collinear);
	REQUIRE(result.outlier_indices == std::vector<std::size_t> {9});

	const std::vector<std::vector<double>> identical(5, std::vector<double> {1.0, 1.0});
	REQUIRE(detector->detect(identical).count() == 0);
}

TEST_CASE("Mahalanobis detector rejects malformed input", "[detectors][mahalanobis][error]") {
	auto detector = MahalanobisDetectorBuilder().build();

	REQUIRE_THROWS_AS(detector->detect(std::vector<std::vector<double>> {}), std::invalid_argument);
	REQUIRE_THROWS_AS(detector->detect(Eigen::MatrixXd(0, 2)), std::invalid_argument);
	REQUIRE_THROWS_AS(detector->detect(std::vector<std::vector<double>> {{1.0, 2.0}, {1.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(detector->detect(std::vector<std::vector<double>> {{1.0}, {std::numeric_limits<double>::infinity()}}),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(MahalanobisDetectorBuilder().withContamination(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(MahalanobisDetectorBuilder().withContamination(1.0).build(), std::invalid_argument);
}

TEST_CASE("Mahalanobis detector accepts a single observation", "[detectors][mahalanobis]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();

	SECTION("one-point series") {
		auto detector = MahalanobisDetectorBuilder().build();
		const auto result = detector->detect(TimeSeries({5.0}));
		REQUIRE(result.count() == 0);
		REQUIRE(result.scores.size() == 1);
		REQUIRE(result.scores[0] == 0.0);
	}

	SECTION("one finite value among missing ones") {
		auto detector = MahalanobisDetectorBuilder().build();
		const auto result = detector->detect(TimeSeries({nan, 5.0}));
		REQUIRE(result.count() == 0);
		REQUIRE(result.flags.size() == 2);
		REQUIRE(std::isnan(result.scores[0]));
		REQUIRE(result.scores[1] == 0.0);
	}

	SECTION("one multivariate row under a forced leave-one-out mode") {
		auto detector = MahalanobisDetectorBuilder().withDistanceMode(DistanceMode::LeaveOneOut).build();
		const auto result = detector->detect(std::vector<std::vector<double>> {{1.0, 2.0}});
		REQUIRE(result.count() == 0);
		REQUIRE(result.scores[0] == 0.0);
	}

	SECTION("no finite values") {
		auto detector = MahalanobisDetectorBuilder().build();
		const auto result = detector->detect(TimeSeries({nan, nan}));
		REQUIRE(result.count() == 0);
		REQUIRE(result.flags.size() == 2);
	}
}
