#include <gtest/gtest.h>
#include "../src/layout/routing/EdgeNudger.h"

using namespace orthograph;

namespace {

std::vector<EdgeNudger::ConnectorPath> sharedCorridor() {
    return {
        {0, {{0, 0}, {100, 0}, {100, 200}, {300, 200}}},
        {1, {{0, 10}, {100, 10}, {100, 210}, {300, 210}}},
    };
}

}  // namespace

// ============================================================================
// Segment extraction
// ============================================================================

TEST(EdgeNudgerTest, ExtractSegments_OnlyInteriorSegments) {
    auto segments = EdgeNudger::extractSegments(sharedCorridor());

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_TRUE(segments[0].isVertical);
    EXPECT_FLOAT_EQ(segments[0].coordinate, 100.0f);
    EXPECT_FLOAT_EQ(segments[0].low, 0.0f);
    EXPECT_FLOAT_EQ(segments[0].high, 200.0f);
    EXPECT_EQ(segments[1].edgeId, 1u);
    EXPECT_EQ(segments[1].segmentIndex, 1u);
}

TEST(EdgeNudgerTest, ExtractSegments_ShortPathsHaveNone) {
    std::vector<EdgeNudger::ConnectorPath> paths{{0, {{0, 0}, {50, 0}, {50, 50}}}};

    EXPECT_TRUE(EdgeNudger::extractSegments(paths).empty());
}

// ============================================================================
// Detection
// ============================================================================

TEST(EdgeNudgerTest, DetectOverlaps_GroupsCloseParallelSegments) {
    EdgeNudger nudger;

    auto groups = nudger.detectOverlaps(sharedCorridor());

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_TRUE(groups[0].isVertical);
    EXPECT_FLOAT_EQ(groups[0].coordinate, 100.0f);
    EXPECT_EQ(groups[0].segments.size(), 2u);
}

TEST(EdgeNudgerTest, DetectOverlaps_IgnoresDistantOrDisjointSegments) {
    EdgeNudger nudger;
    std::vector<EdgeNudger::ConnectorPath> paths{
        {0, {{0, 0}, {100, 0}, {100, 200}, {300, 200}}},
        {1, {{0, 0}, {150, 0}, {150, 200}, {300, 200}}},      // 50 away
        {2, {{0, 300}, {105, 300}, {105, 500}, {300, 500}}},  // no shared span
    };

    EXPECT_TRUE(nudger.detectOverlaps(paths).empty());
}

TEST(EdgeNudgerTest, DetectOverlaps_SameConnectorNeverGroups) {
    EdgeNudger nudger;
    std::vector<EdgeNudger::ConnectorPath> paths{
        {4, {{0, 0}, {100, 0}, {100, 200}, {300, 200}}},
        {4, {{0, 10}, {100, 10}, {100, 210}, {300, 210}}},
    };

    EXPECT_TRUE(nudger.detectOverlaps(paths).empty());
}

// ============================================================================
// Separation
// ============================================================================

TEST(EdgeNudgerTest, Apply_SpreadsSegmentsAroundAverage) {
    EdgeNudger nudger;
    auto paths = sharedCorridor();

    auto result = nudger.apply(paths);

    EXPECT_EQ(result.movedSegments, 1);
    EXPECT_FLOAT_EQ(paths[0].points[1].x, 100.0f);
    EXPECT_FLOAT_EQ(paths[0].points[2].x, 100.0f);
    EXPECT_FLOAT_EQ(paths[1].points[1].x, 110.0f);
    EXPECT_FLOAT_EQ(paths[1].points[2].x, 110.0f);
    // Endpoints stay attached
    EXPECT_EQ(paths[1].points.front(), Point(0, 10));
    EXPECT_EQ(paths[1].points.back(), Point(300, 210));
}

TEST(EdgeNudgerTest, Apply_IsStableOnSeparatedInput) {
    EdgeNudger nudger;
    auto paths = sharedCorridor();
    nudger.apply(paths);
    auto once = paths;

    auto result = nudger.apply(paths);

    EXPECT_EQ(result.movedSegments, 0);
    EXPECT_EQ(paths[1].points, once[1].points);
}

TEST(EdgeNudgerTest, Disabled_DoesNothing) {
    EdgeNudger::Config config;
    config.enabled = false;
    EdgeNudger nudger(config);
    auto paths = sharedCorridor();

    auto result = nudger.apply(paths);

    EXPECT_EQ(result.movedSegments, 0);
    EXPECT_TRUE(result.overlapGroups.empty());
    EXPECT_FLOAT_EQ(paths[1].points[1].x, 100.0f);
}
