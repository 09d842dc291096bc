/*
Candlewick: XY Plotter Tests
Role: Verify line and scatter plotters against a recording canvas
Coverage: Data range, projected geometry, clipping at the canvas edge, input validation
*/
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include "render/plotters/XYPlotters.hpp"
#include "plot/Plot.hpp"
#include "Errors.hpp"
#include "fixtures/spy_canvas.hpp"

class XYPlotterTest : public ::testing::Test {
protected:
    XYs points{{0.0, 0.0}, {1.0, 1.0}, {2.0, 4.0}};
    SpyCanvas canvas{QRectF(0, 0, 200, 400)};
};

TEST_F(XYPlotterTest, LineDataRange) {
    DataRange range = LinePlotter(points).dataRange();

    EXPECT_DOUBLE_EQ(range.xMin, 0.0);
    EXPECT_DOUBLE_EQ(range.xMax, 2.0);
    EXPECT_DOUBLE_EQ(range.yMin, 0.0);
    EXPECT_DOUBLE_EQ(range.yMax, 4.0);
}

TEST_F(XYPlotterTest, LineStrokesProjectedPolyline) {
    auto line = std::make_shared<LinePlotter>(points, LineStyle{QColor(Qt::green), 2.0});
    Plot plot;
    plot.add(line);

    line->plot(canvas, plot);

    ASSERT_EQ(canvas.callCount(), 1u);
    const auto& call = canvas.call(0);
    EXPECT_EQ(call.kind, SpyCanvas::Kind::Stroke);
    EXPECT_EQ(call.color, QColor(Qt::green));
    EXPECT_DOUBLE_EQ(call.width, 2.0);
    ASSERT_EQ(call.lines.size(), 1u);
    ASSERT_EQ(call.lines[0].size(), 3);
    EXPECT_EQ(call.lines[0][0], QPointF(0, 400));
    EXPECT_EQ(call.lines[0][1], QPointF(100, 300));
    EXPECT_EQ(call.lines[0][2], QPointF(200, 0));
}

TEST_F(XYPlotterTest, LineClippedAtTopEdge) {
    auto line = std::make_shared<LinePlotter>(points);
    Plot plot;
    plot.add(line);
    plot.yAxis().max = 2.0;

    line->plot(canvas, plot);

    ASSERT_EQ(canvas.callCount(), 1u);
    const auto& lines = canvas.call(0).lines;
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].size(), 3);
    EXPECT_EQ(lines[0][1], QPointF(100, 200));
    EXPECT_NEAR(lines[0][2].x(), 400.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(lines[0][2].y(), 0.0);
}

TEST_F(XYPlotterTest, ScatterSkipsPointsOutsideCanvas) {
    auto scatter = std::make_shared<ScatterPlotter>(points, GlyphStyle{QColor(Qt::red), 2.5});
    scatter->setRadius(3.0);
    Plot plot;
    plot.add(scatter);
    plot.yAxis().max = 2.0;

    scatter->plot(canvas, plot);

    ASSERT_EQ(canvas.callCount(), 2u);
    EXPECT_EQ(canvas.call(0).kind, SpyCanvas::Kind::Glyph);
    EXPECT_EQ(canvas.call(0).center, QPointF(0, 400));
    EXPECT_EQ(canvas.call(1).center, QPointF(100, 200));
    EXPECT_DOUBLE_EQ(canvas.call(1).width, 3.0);
    EXPECT_EQ(canvas.call(1).color, QColor(Qt::red));
}

TEST(XYPlotterInput, IndexedPoints) {
    XYs xy = indexedXYs({5.0, 7.0});
    ASSERT_EQ(xy.size(), 2u);
    EXPECT_EQ(xy[0], QPointF(0, 5));
    EXPECT_EQ(xy[1], QPointF(1, 7));
}

TEST(XYPlotterInput, PairedLengthMismatchThrows) {
    EXPECT_THROW(pairedXYs({1, 2, 3}, {1, 2}), candlewick::LengthMismatchError);
    EXPECT_NO_THROW(pairedXYs({1, 2}, {3, 4}));
}

TEST(XYPlotterInput, EmptyPointsThrow) {
    EXPECT_THROW(LinePlotter(XYs{}), candlewick::EmptyInputError);
    EXPECT_THROW(ScatterPlotter(XYs{}), candlewick::EmptyInputError);
}

TEST(XYPlotterInput, NonFiniteCoordinateThrows) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(LinePlotter(XYs{{0, 1}, {1, nan}}), candlewick::ChartInputError);
    EXPECT_THROW(ScatterPlotter(XYs{{std::numeric_limits<double>::infinity(), 1}}),
                 candlewick::ChartInputError);
}
