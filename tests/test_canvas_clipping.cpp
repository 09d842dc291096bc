#include <gtest/gtest.h>
#include "fixtures/spy_canvas.hpp"

class CanvasClippingTest : public ::testing::Test {
protected:
    SpyCanvas canvas{QRectF(0, 0, 100, 100)};
};

TEST_F(CanvasClippingTest, PolygonInsideIsUnchanged) {
    QPolygonF square({QPointF(10, 10), QPointF(10, 90), QPointF(90, 90), QPointF(90, 10)});
    EXPECT_EQ(canvas.clipPolygonY(square), square);
}

TEST_F(CanvasClippingTest, PolygonCutAtTopEdge) {
    QPolygonF rect({QPointF(10, -50), QPointF(10, 50), QPointF(90, 50), QPointF(90, -50)});
    QPolygonF clipped = canvas.clipPolygonY(rect);

    ASSERT_EQ(clipped.size(), 4);
    for (const auto& p : clipped) {
        EXPECT_GE(p.y(), 0.0);
        EXPECT_LE(p.y(), 50.0);
    }
    EXPECT_TRUE(clipped.contains(QPointF(10, 0)));
    EXPECT_TRUE(clipped.contains(QPointF(90, 0)));
}

TEST_F(CanvasClippingTest, PolygonIgnoresXExtent) {
    QPolygonF wide({QPointF(-50, 10), QPointF(-50, 20), QPointF(150, 20), QPointF(150, 10)});
    EXPECT_EQ(canvas.clipPolygonY(wide), wide);
}

TEST_F(CanvasClippingTest, PolygonOutsideIsEmpty) {
    QPolygonF below({QPointF(10, 150), QPointF(10, 160), QPointF(20, 160)});
    EXPECT_TRUE(canvas.clipPolygonY(below).isEmpty());
}

TEST_F(CanvasClippingTest, LineCutAtBoundary) {
    auto pieces = canvas.clipLinesY({QPolygonF({QPointF(10, -20), QPointF(10, 50)})});

    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0], QPolygonF({QPointF(10, 0), QPointF(10, 50)}));
}

TEST_F(CanvasClippingTest, LineLeavingAndReenteringIsSplit) {
    auto pieces = canvas.clipLinesY({QPolygonF({QPointF(0, 50), QPointF(0, 150), QPointF(10, 50)})});

    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0], QPolygonF({QPointF(0, 50), QPointF(0, 100)}));
    EXPECT_EQ(pieces[1], QPolygonF({QPointF(5, 100), QPointF(10, 50)}));
}

TEST_F(CanvasClippingTest, ZeroLengthSegmentOnBoundarySurvives) {
    auto pieces = canvas.clipLinesY({QPolygonF({QPointF(5, 100), QPointF(5, 100)})});

    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0].size(), 2);
}

TEST_F(CanvasClippingTest, ZeroLengthSegmentOutsideIsDropped) {
    auto pieces = canvas.clipLinesY({QPolygonF({QPointF(5, 150), QPointF(5, 150)})});
    EXPECT_TRUE(pieces.empty());
}

TEST_F(CanvasClippingTest, ClipLinesXYCutsAllEdges) {
    auto pieces = canvas.clipLinesXY({QPolygonF({QPointF(-10, 50), QPointF(110, 50)})});

    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0], QPolygonF({QPointF(0, 50), QPointF(100, 50)}));
}

TEST_F(CanvasClippingTest, ContainsIsInclusive) {
    EXPECT_TRUE(canvas.contains(QPointF(0, 0)));
    EXPECT_TRUE(canvas.contains(QPointF(100, 100)));
    EXPECT_FALSE(canvas.contains(QPointF(100.5, 50)));
}
