#include <gtest/gtest.h>
#include <orthograph/core/Types.h>
#include <orthograph/core/GeometryUtils.h>

using namespace orthograph;

// ============================================================================
// Rect
// ============================================================================

TEST(RectTest, DerivedAccessors) {
    Rect r{10, 20, 100, 50};

    EXPECT_FLOAT_EQ(r.right(), 110.0f);
    EXPECT_FLOAT_EQ(r.bottom(), 70.0f);
    EXPECT_FLOAT_EQ(r.centerX(), 60.0f);
    EXPECT_FLOAT_EQ(r.centerY(), 45.0f);
    EXPECT_EQ(r.center(), Point(60, 45));
}

TEST(RectTest, Intersects_TouchingEdgesDoNotCount) {
    Rect a{0, 0, 100, 100};
    Rect b{100, 0, 100, 100};

    EXPECT_FALSE(a.intersects(b));
    EXPECT_TRUE(a.intersects(b, 1.0f));
}

TEST(RectTest, Intersects_MarginWidensRequiredGap) {
    Rect a{0, 0, 100, 100};
    Rect b{130, 0, 100, 100};

    EXPECT_FALSE(a.intersects(b, 30.0f));
    EXPECT_TRUE(a.intersects(b, 30.5f));
}

TEST(RectTest, UnitedAndExpanded) {
    Rect a{0, 0, 10, 10};
    Rect b{20, 30, 10, 10};

    EXPECT_EQ(a.united(b), Rect(0, 0, 30, 40));
    EXPECT_EQ(a.expanded(5), Rect(-5, -5, 20, 20));
    EXPECT_EQ(a.translated(3, 4), Rect(3, 4, 10, 10));
}

// ============================================================================
// Grid snapping
// ============================================================================

TEST(GridTest, SnapToGrid_RoundsToNearestMultiple) {
    EXPECT_FLOAT_EQ(grid::snapToGrid(14.0f, 10.0f), 10.0f);
    EXPECT_FLOAT_EQ(grid::snapToGrid(16.0f, 10.0f), 20.0f);
    EXPECT_FLOAT_EQ(grid::snapToGrid(-16.0f, 10.0f), -20.0f);
    EXPECT_FLOAT_EQ(grid::snapToGrid(37.0f, 25.0f), 25.0f);
}

TEST(GridTest, ZeroGridUsesDefault) {
    EXPECT_FLOAT_EQ(grid::snapToGrid(14.0f, 0.0f), 10.0f);
    EXPECT_FLOAT_EQ(grid::snapToGrid(14.0f, -5.0f), 10.0f);
}

TEST(GridTest, DirectionalSnaps) {
    EXPECT_FLOAT_EQ(grid::snapDown(19.0f, 10.0f), 10.0f);
    EXPECT_FLOAT_EQ(grid::snapUp(11.0f, 10.0f), 20.0f);
    EXPECT_FLOAT_EQ(grid::snapUp(20.0f, 10.0f), 20.0f);
    EXPECT_TRUE(grid::isOnGrid(30.0f, 10.0f));
    EXPECT_FALSE(grid::isOnGrid(31.0f, 10.0f));
}

// ============================================================================
// Segment tests
// ============================================================================

TEST(GridTest, SnapWaypoint_KeepsEndpointAxes) {
    const Point from{0, 100};
    const Point to{404, 263};

    EXPECT_EQ(grid::snapWaypoint({404, 57}, 10.0f, from, to), Point(404, 60));
    EXPECT_EQ(grid::snapWaypoint({203, 263}, 10.0f, from, to), Point(200, 263));
    EXPECT_EQ(grid::snapWaypoint({203, 57}, 10.0f, from, to), Point(200, 60));
}

TEST(GeometryTest, LineIntersectsRect_DiagonalThroughBox) {
    Rect box{40, 40, 20, 20};

    EXPECT_TRUE(geometry::lineIntersectsRect({0, 0}, {100, 100}, box));
    EXPECT_FALSE(geometry::lineIntersectsRect({0, 100}, {30, 70}, box));
}

TEST(GeometryTest, LineIntersectsRect_BoundaryIsInclusive) {
    Rect box{0, 0, 10, 10};

    EXPECT_TRUE(geometry::lineIntersectsRect({10, -5}, {10, 20}, box));
}

TEST(GeometryTest, SegmentCrossesInterior_IgnoresBoundaryRuns) {
    Rect box{0, 0, 100, 100};

    // Along the top edge
    EXPECT_FALSE(geometry::segmentCrossesInterior({-10, 0}, {110, 0}, box));
    // Straight through the middle
    EXPECT_TRUE(geometry::segmentCrossesInterior({-10, 50}, {110, 50}, box));
}

TEST(GeometryTest, AnyObstacleOnSegment_UsesMargin) {
    std::vector<Rect> obstacles{{100, 100, 50, 50}};

    EXPECT_FALSE(geometry::anyObstacleOnSegment({0, 80}, {300, 80}, obstacles, 10.0f));
    EXPECT_TRUE(geometry::anyObstacleOnSegment({0, 80}, {300, 80}, obstacles, 25.0f));
}
