#include <gtest/gtest.h>
#include "../src/layout/pathfinding/AStarPathFinder.h"
#include <orthograph/core/GeometryUtils.h>

using namespace orthograph;
using namespace orthograph::algorithms;

namespace {

RouterOptions scenarioOptions() {
    return RouterOptions{}.setMargin(15.0f).setGridSize(10.0f).setBendPenalty(5.0f);
}

}  // namespace

// ============================================================================
// AStarPathFinderTest
// ============================================================================

class AStarPathFinderTest : public ::testing::Test {
protected:
    AStarPathFinder finder;

    // Two small boxes on one row with a 100x100 block between them
    const Rect source{-20, 80, 40, 40};
    const Rect target{380, 80, 40, 40};
    const std::vector<Rect> obstacles{{180, 80, 100, 100}};
};

TEST_F(AStarPathFinderTest, ClearLine_IsDirect) {
    RouteResult result = finder.findRoute(source, target, {}, scenarioOptions());

    EXPECT_EQ(result.kind, RouteKind::Direct);
    EXPECT_TRUE(result.waypoints.empty());
    EXPECT_EQ(result.expansions, 0);
}

TEST_F(AStarPathFinderTest, BlockedLine_DetoursOverTheObstacle) {
    RouteResult result = finder.findRoute(source, target, obstacles, scenarioOptions());

    EXPECT_EQ(result.kind, RouteKind::Searched);
    ASSERT_EQ(result.waypoints.size(), 2u);
    EXPECT_EQ(result.waypoints[0], Point(0, 60));
    EXPECT_EQ(result.waypoints[1], Point(400, 60));
    EXPECT_GT(result.expansions, 0);
}

TEST_F(AStarPathFinderTest, Route_KeepsClearanceAndStaysOrthogonal) {
    RouteResult result = finder.findRoute(source, target, obstacles, scenarioOptions());

    std::vector<Point> full;
    full.push_back(source.center());
    full.insert(full.end(), result.waypoints.begin(), result.waypoints.end());
    full.push_back(target.center());

    for (size_t i = 0; i + 1 < full.size(); ++i) {
        const Point& a = full[i];
        const Point& b = full[i + 1];
        EXPECT_TRUE(a.x == b.x || a.y == b.y) << "segment " << i << " is diagonal";
        for (const auto& obs : obstacles) {
            EXPECT_FALSE(geometry::segmentCrossesInterior(a, b, obs.expanded(15.0f)))
                << "segment " << i << " enters the clearance zone";
        }
    }
    for (const auto& p : result.waypoints) {
        EXPECT_TRUE(grid::isOnGrid(p.x, 10.0f));
        EXPECT_TRUE(grid::isOnGrid(p.y, 10.0f));
    }
}

TEST_F(AStarPathFinderTest, OffGridTargetCenter_LastLegStaysVertical) {
    // Center at x=404, which the 10px grid would round to 400
    const Rect wideTarget{380, 80, 48, 40};

    RouteResult result = finder.findRoute(source, wideTarget, obstacles, scenarioOptions());

    EXPECT_EQ(result.kind, RouteKind::Searched);
    ASSERT_EQ(result.waypoints.size(), 2u);
    EXPECT_EQ(result.waypoints[0], Point(0, 60));
    EXPECT_EQ(result.waypoints[1], Point(404, 60));
    EXPECT_EQ(result.waypoints.back().x, wideTarget.center().x);
}

TEST_F(AStarPathFinderTest, SameInputs_SameRoute) {
    RouteResult first = finder.findRoute(source, target, obstacles, scenarioOptions());
    RouteResult second = finder.findRoute(source, target, obstacles, scenarioOptions());

    EXPECT_EQ(first.waypoints, second.waypoints);
    EXPECT_EQ(first.expansions, second.expansions);
}

TEST_F(AStarPathFinderTest, ExpansionCap_FallsBackToWideDetour) {
    RouteResult result = finder.findRoute(source, target, obstacles,
                                          scenarioOptions().setMaxExpansions(1));

    EXPECT_EQ(result.kind, RouteKind::Fallback);
    ASSERT_EQ(result.waypoints.size(), 2u);
    // Above every obstacle by twice the margin
    EXPECT_EQ(result.waypoints[0], Point(0, 50));
    EXPECT_EQ(result.waypoints[1], Point(400, 50));
}

TEST(AStarFallbackTest, MostlyVertical_DetoursSideways) {
    Rect top{100, 0, 40, 40};
    Rect bottom{100, 400, 40, 40};
    std::vector<Rect> obstacles{{60, 150, 200, 100}};

    auto points = AStarPathFinder::fallbackRoute(top, bottom, obstacles, 10.0f, 10.0f);

    // Left line 40 is closer to the midpoint x=120 than the right line 280
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0], Point(40, 20));
    EXPECT_EQ(points[1], Point(40, 420));
}

TEST(AStarSimplifyTest, KeepsOnlyTurns) {
    std::vector<Point> path{{0, 0}, {10, 0}, {20, 0}, {20, 10}, {20, 20}, {30, 20}};

    auto turns = AStarPathFinder::simplifyPath(path);

    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0], Point(20, 0));
    EXPECT_EQ(turns[1], Point(20, 20));
}

TEST(AStarSimplifyTest, ShortPaths_HaveNoWaypoints) {
    EXPECT_TRUE(AStarPathFinder::simplifyPath({}).empty());
    EXPECT_TRUE(AStarPathFinder::simplifyPath({{0, 0}, {50, 0}}).empty());
    EXPECT_TRUE(AStarPathFinder::simplifyPath({{0, 0}, {25, 0}, {50, 0}}).empty());
}
