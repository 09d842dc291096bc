#include <gtest/gtest.h>
#include <algorithm>
#include "CandleSeries.hpp"
#include "Errors.hpp"
#include "fixtures/sample_periods.hpp"

TEST(CandleSeries, BuildsCandlesInOrder) {
    CandleSeries series = CandleSeries::build(fixtures::twoPeriods());

    ASSERT_EQ(series.size(), 2u);
    EXPECT_DOUBLE_EQ(series[0].position(), 0.0);
    EXPECT_DOUBLE_EQ(series[1].position(), 1.0);

    EXPECT_DOUBLE_EQ(series[0].open(), 10.0);
    EXPECT_DOUBLE_EQ(series[0].close(), 11.0);
    EXPECT_EQ(series[0].direction(), CandleDirection::Up);

    EXPECT_DOUBLE_EQ(series[1].open(), 11.0);
    EXPECT_DOUBLE_EQ(series[1].close(), 9.0);
    EXPECT_EQ(series[1].direction(), CandleDirection::Down);
}

TEST(CandleSeries, GlobalExtremes) {
    CandleSeries series = CandleSeries::build(fixtures::twoPeriods());

    EXPECT_DOUBLE_EQ(series.globalLow(), 9.0);
    EXPECT_DOUBLE_EQ(series.globalHigh(), 13.0);
}

TEST(CandleSeries, GlobalExtremesMatchPerCandleScan) {
    CandleSeries series = CandleSeries::build({{5, 6}, {3, 8, 4}, {7, 2, 9, 6}, {4}});

    double low = series[0].low();
    double high = series[0].high();
    for (const auto& c : series) {
        low = std::min(low, c.low());
        high = std::max(high, c.high());
    }
    EXPECT_DOUBLE_EQ(series.globalLow(), low);
    EXPECT_DOUBLE_EQ(series.globalHigh(), high);
    EXPECT_DOUBLE_EQ(series.globalLow(), 2.0);
    EXPECT_DOUBLE_EQ(series.globalHigh(), 9.0);
}

TEST(CandleSeries, NoPeriodsThrows) {
    EXPECT_THROW(CandleSeries::build({}), candlewick::EmptyInputError);
}

TEST(CandleSeries, EmptyPeriodThrows) {
    EXPECT_THROW(CandleSeries::build({{1, 2}, {}, {3}}), candlewick::EmptyInputError);
}

TEST(CandleSeries, SinglePeriodBuilds) {
    CandleSeries series = CandleSeries::build({{4, 2, 6}});
    ASSERT_EQ(series.size(), 1u);
    EXPECT_DOUBLE_EQ(series.globalLow(), 2.0);
    EXPECT_DOUBLE_EQ(series.globalHigh(), 6.0);
}
