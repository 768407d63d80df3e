#include <gtest/gtest.h>
#include "../src/layout/optimization/PathCleanup.h"
#include "../src/layout/optimization/ChannelCentering.h"

using namespace orthograph;

// ============================================================================
// PathCleanup
// ============================================================================

TEST(PathCleanupTest, RemoveCollinear_DropsMidpointsOnStraightRuns) {
    std::vector<Point> path{{20, 20}, {60, 20}, {100, 20}, {100, 80}, {100, 140}, {200, 140}};

    auto result = PathCleanup::removeCollinear(path);

    std::vector<Point> expected{{20, 20}, {100, 20}, {100, 140}, {200, 140}};
    EXPECT_EQ(result, expected);
}

TEST(PathCleanupTest, RemoveCollinear_KeepsEndpoints) {
    std::vector<Point> path{{0, 0}, {50, 0}, {100, 0}};

    auto result = PathCleanup::removeCollinear(path);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.front(), Point(0, 0));
    EXPECT_EQ(result.back(), Point(100, 0));
}

TEST(PathCleanupTest, Straighten_AlignsNearlyVerticalRun) {
    std::vector<Point> path{{20, 20}, {103, 20}, {100, 120}, {100, 220}};

    auto result = PathCleanup::straighten(path, 8.0f);

    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[1], Point(103, 20));
    EXPECT_EQ(result[2], Point(103, 120));
    EXPECT_EQ(result[3], Point(100, 220));
}

TEST(PathCleanupTest, Straighten_LeavesRealJogsAlone) {
    std::vector<Point> path{{0, 0}, {40, 0}, {40, 50}, {90, 50}};

    EXPECT_EQ(PathCleanup::straighten(path, 8.0f), path);
}

TEST(PathCleanupTest, ShortenDetours_RemovesUnneededBends) {
    std::vector<Point> path{{0, 0}, {0, 100}, {200, 100}, {200, 0}};

    auto result = PathCleanup::shortenDetours(path, {}, 10.0f);

    std::vector<Point> expected{{0, 0}, {200, 0}};
    EXPECT_EQ(result, expected);
}

TEST(PathCleanupTest, ShortenDetours_KeepsBendsAroundObstacles) {
    std::vector<Point> path{{0, 0}, {0, 100}, {200, 100}, {200, 0}};
    std::vector<Rect> obstacles{{80, -20, 40, 60}};

    EXPECT_EQ(PathCleanup::shortenDetours(path, obstacles, 10.0f), path);
}

TEST(PathCleanupTest, ShortenDetours_SingleWaypointUnchanged) {
    std::vector<Point> path{{0, 0}, {0, 100}, {100, 100}};

    EXPECT_EQ(PathCleanup::shortenDetours(path, {}, 10.0f), path);
}

TEST(PathCleanupTest, RemoveDuplicates) {
    std::vector<Point> points{{10, 10}, {10.05f, 10}, {20, 10}, {20, 10}, {10, 10}};

    PathCleanup::removeDuplicates(points);

    std::vector<Point> expected{{10, 10}, {20, 10}, {10, 10}};
    EXPECT_EQ(points, expected);
}

// ============================================================================
// ChannelCentering
// ============================================================================

TEST(ChannelCenteringTest, InteriorSegment_MovesToChannelMiddle) {
    std::vector<Point> path{{0, 0}, {40, 0}, {40, 100}, {200, 100}};
    std::vector<Rect> obstacles{{0, 20, 20, 60}, {100, 20, 20, 60}};

    auto result = ChannelCentering::center(path, obstacles, 10.0f);

    std::vector<Point> expected{{0, 0}, {60, 0}, {60, 100}, {200, 100}};
    EXPECT_EQ(result, expected);
}

TEST(ChannelCenteringTest, OpenSide_LeavesSegment) {
    std::vector<Point> path{{0, 0}, {40, 0}, {40, 100}, {200, 100}};
    std::vector<Rect> obstacles{{0, 20, 20, 60}};

    EXPECT_EQ(ChannelCentering::center(path, obstacles, 10.0f), path);
}

TEST(ChannelCenteringTest, LargeShift_IsRejected) {
    // Channel 30..290, middle 160 is more than 40% of the width away from 40
    std::vector<Point> path{{0, 0}, {40, 0}, {40, 100}, {400, 100}};
    std::vector<Rect> obstacles{{0, 20, 20, 60}, {300, 20, 20, 60}};

    EXPECT_EQ(ChannelCentering::center(path, obstacles, 10.0f), path);
}

TEST(ChannelCenteringTest, FindChannel_ReportsBounds) {
    std::vector<Rect> obstacles{{0, 20, 20, 60}, {100, 20, 20, 60}};
    float lower = 0.0f;
    float upper = 0.0f;

    ASSERT_TRUE(ChannelCentering::findChannel(40, 0, 100, true, obstacles, 10.0f, lower, upper));
    EXPECT_FLOAT_EQ(lower, 30.0f);
    EXPECT_FLOAT_EQ(upper, 90.0f);
}
