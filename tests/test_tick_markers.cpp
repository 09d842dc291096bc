#include <gtest/gtest.h>
#include <memory>
#include "models/DefaultTicks.hpp"
#include "models/IntegerTicks.hpp"
#include "fixtures/stub_tick_marker.hpp"

// =============================================================================
// IntegerTicks
// =============================================================================

TEST(IntegerTicks, StripsDecimalsFromLabels) {
    auto stub = std::make_shared<StubTickMarker>(std::vector<Tick>{
        {3.0, "3.0"}, {3.5, ""}, {4.0, "4.0"}, {4.5, ""}, {5.0, "5.00"}
    });
    IntegerTicks ticks(stub);

    auto result = ticks.ticks(3.0, 5.0);
    ASSERT_EQ(result.size(), 5u);
    EXPECT_EQ(result[0].label, "3");
    EXPECT_EQ(result[1].label, "");
    EXPECT_EQ(result[2].label, "4");
    EXPECT_EQ(result[3].label, "");
    EXPECT_EQ(result[4].label, "5");
}

TEST(IntegerTicks, KeepsPositionsAndForwardsRange) {
    auto stub = std::make_shared<StubTickMarker>(std::vector<Tick>{{9.0, "9.0"}, {9.5, ""}, {10.0, "10.0"}});
    IntegerTicks ticks(stub);

    auto result = ticks.ticks(8.75, 10.25);
    EXPECT_DOUBLE_EQ(stub->lastMin(), 8.75);
    EXPECT_DOUBLE_EQ(stub->lastMax(), 10.25);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_DOUBLE_EQ(result[0].value, 9.0);
    EXPECT_DOUBLE_EQ(result[1].value, 9.5);
    EXPECT_DOUBLE_EQ(result[2].value, 10.0);
}

TEST(IntegerTicks, RoundsToNearestInteger) {
    auto stub = std::make_shared<StubTickMarker>(std::vector<Tick>{{2.6, "2.6"}, {12.25, "12.25"}, {-3.75, "-3.75"}});
    auto result = IntegerTicks(stub).ticks(0, 1);

    EXPECT_EQ(result[0].label, "3");
    EXPECT_EQ(result[1].label, "12");
    EXPECT_EQ(result[2].label, "-4");
}

TEST(IntegerTicks, HalvesRoundToEven) {
    auto stub = std::make_shared<StubTickMarker>(std::vector<Tick>{
        {0.5, "0.5"}, {2.5, "2.5"}, {-2.5, "-2.5"}, {11.5, "11.5"}});
    auto result = IntegerTicks(stub).ticks(0, 12);

    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0].label, "0");
    EXPECT_EQ(result[1].label, "2");
    EXPECT_EQ(result[2].label, "-2");
    EXPECT_EQ(result[3].label, "12");
}

TEST(IntegerTicks, HalfStepPriceAxis) {
    // Prices 9 to 11.5 get a 0.5 step from the default marker
    auto result = IntegerTicks().ticks(9.0, 11.5);

    std::vector<QString> labels;
    for (const auto& tick : result) {
        if (!tick.isMinor()) labels.push_back(tick.label);
    }
    EXPECT_EQ(labels, (std::vector<QString>{"9", "10", "10", "10", "11", "12"}));
}

TEST(IntegerTicks, IntegerLabelsAreIdempotent) {
    auto stub = std::make_shared<StubTickMarker>(std::vector<Tick>{{7.0, "7"}, {1200.0, "1200"}});
    IntegerTicks once(stub);
    auto first = once.ticks(0, 1);

    auto again = std::make_shared<StubTickMarker>(first);
    auto second = IntegerTicks(again).ticks(0, 1);

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].label, "7");
    EXPECT_EQ(first[1].label, "1200");
    EXPECT_EQ(second[0].label, first[0].label);
    EXPECT_EQ(second[1].label, first[1].label);
}

TEST(IntegerTicks, NonNumericLabelPassesThrough) {
    auto stub = std::make_shared<StubTickMarker>(std::vector<Tick>{{1.0, "open"}, {2.0, "2.0"}});
    auto result = IntegerTicks(stub).ticks(0, 3);

    EXPECT_EQ(result[0].label, "open");
    EXPECT_EQ(result[1].label, "2");
}

TEST(IntegerTicks, DefaultsToDefaultTicks) {
    auto result = IntegerTicks().ticks(9.0, 13.0);

    std::vector<QString> majors;
    for (const auto& t : result) {
        if (!t.isMinor()) majors.push_back(t.label);
    }
    EXPECT_EQ(majors, (std::vector<QString>{"9", "10", "11", "12", "13"}));
}

// =============================================================================
// DefaultTicks
// =============================================================================

TEST(DefaultTicks, MajorAndMinorTicksInOrder) {
    auto result = DefaultTicks().ticks(9.0, 13.0);

    ASSERT_EQ(result.size(), 9u);
    EXPECT_EQ(result.front().label, "9.0");
    EXPECT_EQ(result.back().label, "13.0");
    for (size_t i = 1; i < result.size(); ++i) {
        EXPECT_LT(result[i - 1].value, result[i].value);
    }
    EXPECT_TRUE(result[1].isMinor());
    EXPECT_DOUBLE_EQ(result[1].value, 9.5);
}

TEST(DefaultTicks, LabelsCarryStepDecimals) {
    auto result = DefaultTicks().ticks(0.0, 0.2);

    ASSERT_FALSE(result.empty());
    EXPECT_EQ(result.front().label, "0.00");
    EXPECT_EQ(DefaultTicks::decimalPlaces(0.05), 2);
    EXPECT_EQ(DefaultTicks::decimalPlaces(0.5), 1);
    EXPECT_EQ(DefaultTicks::decimalPlaces(20.0), 0);
}

TEST(DefaultTicks, NiceSteps) {
    EXPECT_DOUBLE_EQ(DefaultTicks::niceStep(4.0, 5), 1.0);
    EXPECT_DOUBLE_EQ(DefaultTicks::niceStep(100.0, 5), 20.0);
    EXPECT_DOUBLE_EQ(DefaultTicks::niceStep(3000.0, 5), 1000.0);
    EXPECT_DOUBLE_EQ(DefaultTicks::niceStep(0.0, 5), 1.0);
}

TEST(DefaultTicks, EmptyRangeHasNoTicks) {
    EXPECT_TRUE(DefaultTicks().ticks(5.0, 5.0).empty());
    EXPECT_TRUE(DefaultTicks().ticks(6.0, 5.0).empty());
}

TEST(ConstantTicks, IgnoresRange) {
    ConstantTicks ticks({{0.0, "a"}, {1.0, "b"}});
    auto result = ticks.ticks(-100.0, 100.0);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[1].label, "b");
}
