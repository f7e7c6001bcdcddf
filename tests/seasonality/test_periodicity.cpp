#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-stats/seasonality/periodicity.hpp"
#include "common/series_helpers.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using demandstats::seasonality::PeriodClass;
using demandstats::seasonality::PeriodicityEstimator;
using demandstats::seasonality::classifyPeriod;

TEST_CASE("Periodicity estimator finds the dominant cycle", "[seasonality][periodicity]") {
    const auto estimator = PeriodicityEstimator::builder().build();
    REQUIRE(estimator.maxLags() == 40);
    REQUIRE(estimator.defaultPeriod() == 12);

    SECTION("weekly sawtooth") {
        std::vector<double> data;
        for (std::size_t i = 0; i < 70; ++i) {
            data.push_back(static_cast<double>(i % 7 + 1));
        }
        REQUIRE(estimator.estimate(data) == 7);
    }

    SECTION("repeated weekly demand profile") {
        const std::vector<double> week {10.0, 12.0, 15.0, 20.0, 30.0, 25.0, 11.0};
        std::vector<double> data;
        for (int rep = 0; rep < 12; ++rep) {
            data.insert(data.end(), week.begin(), week.end());
        }
        REQUIRE(estimator.estimate(data) == 7);
    }

    SECTION("monthly sine") {
        REQUIRE(estimator.estimate(tests::helpers::sineWave(72, 12)) == 12);
    }
}

TEST_CASE("Periodicity estimator falls back to the default period", "[seasonality][periodicity]") {
    const auto estimator = PeriodicityEstimator::builder().defaultPeriod(4).build();

    REQUIRE(estimator.estimate(tests::helpers::linearSeries(1.0, 1.0, 50)) == 4);
    REQUIRE(estimator.estimate({1.0, 2.0, 3.0}) == 4);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(estimator.estimate({nan, nan}) == 4);
}

TEST_CASE("Autocorrelation is normalised at lag zero", "[seasonality][periodicity]") {
    const auto acf = PeriodicityEstimator::autocorrelation({1.0, 2.0, 3.0, 4.0}, 2);
    REQUIRE(acf.size() == 3);
    REQUIRE(acf[0] == Catch::Approx(1.0));
    // Biased estimator: sum((x_t - m)(x_{t+1} - m)) / sum((x_t - m)^2) = 1.25 / 5.
    REQUIRE(acf[1] == Catch::Approx(0.25));

    const auto flat = PeriodicityEstimator::autocorrelation({3.0, 3.0, 3.0}, 2);
    REQUIRE(flat[1] == 0.0);
}

TEST_CASE("Period classification", "[seasonality][periodicity]") {
    REQUIRE(classifyPeriod(7.0) == PeriodClass::Weekly);
    REQUIRE(classifyPeriod(30.0) == PeriodClass::Monthly);
    REQUIRE(classifyPeriod(91.0) == PeriodClass::Quarterly);
    REQUIRE(classifyPeriod(365.0) == PeriodClass::Annual);
    REQUIRE(classifyPeriod(12.0) == PeriodClass::Custom);
    REQUIRE(toString(PeriodClass::Quarterly) == "quarterly");
}

TEST_CASE("Periodicity builder validates its settings", "[seasonality][periodicity][error]") {
    REQUIRE_THROWS_AS(PeriodicityEstimator::builder().maxLags(1).build(), std::invalid_argument);
    REQUIRE_THROWS_AS(PeriodicityEstimator::builder().defaultPeriod(1).build(), std::invalid_argument);
}
