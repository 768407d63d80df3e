#include <gtest/gtest.h>
#include <orthograph/layout/PortDistributor.h>

using namespace orthograph;

// ============================================================================
// Single connection
// ============================================================================

TEST(PortDistributorTest, ChooseBestPorts_HorizontalNeighbor) {
    auto ports = PortDistributor::chooseBestPorts({0, 0, 100, 60}, {300, 10, 100, 60});

    EXPECT_EQ(ports.exit, (PortAnchor{1.0f, 0.5f}));
    EXPECT_EQ(ports.entry, (PortAnchor{0.0f, 0.5f}));
}

TEST(PortDistributorTest, ChooseBestPorts_TargetAboveUsesTopSide) {
    auto ports = PortDistributor::chooseBestPorts({0, 300, 100, 60}, {10, 0, 100, 60});

    EXPECT_EQ(ports.exit, (PortAnchor{0.5f, 0.0f}));
    EXPECT_EQ(ports.entry, (PortAnchor{0.5f, 1.0f}));
}

TEST(PortDistributorTest, ChooseBestPorts_DiagonalPicksLargerDelta) {
    // dx=100, dy=80: neither dominates, horizontal wins
    auto wide = PortDistributor::chooseBestPorts({0, 0, 100, 60}, {100, 80, 100, 60});
    EXPECT_EQ(wide.exit, (PortAnchor{1.0f, 0.5f}));

    // dx=80, dy=100: vertical wins
    auto tall = PortDistributor::chooseBestPorts({0, 0, 100, 60}, {80, 100, 100, 60});
    EXPECT_EQ(tall.exit, (PortAnchor{0.5f, 1.0f}));
}

TEST(PortDistributorTest, ChooseBestPorts_PreferenceOverridesGeometry) {
    auto ports = PortDistributor::chooseBestPorts({0, 0, 100, 60}, {300, 0, 100, 60},
                                                  PortPreference::Vertical);

    EXPECT_EQ(ports.exit, (PortAnchor{0.5f, 1.0f}));
    EXPECT_EQ(ports.entry, (PortAnchor{0.5f, 0.0f}));
}

TEST(PortDistributorTest, DetermineSides_DiagonalPrefersVertical) {
    auto sides = PortDistributor::determineSides({0, 0, 100, 100}, {100, 100, 100, 100});

    EXPECT_EQ(sides.first, PortSide::Bottom);
    EXPECT_EQ(sides.second, PortSide::Top);

    auto left = PortDistributor::determineSides({500, 0, 100, 100}, {0, 50, 100, 100});
    EXPECT_EQ(left.first, PortSide::Left);
    EXPECT_EQ(left.second, PortSide::Right);
}

TEST(PortDistributorTest, DistributeOnSide_KeepsCornerMargin) {
    EXPECT_EQ(PortDistributor::distributeOnSide(PortSide::Top, 1, 0), (PortAnchor{0.5f, 0.0f}));

    PortAnchor first = PortDistributor::distributeOnSide(PortSide::Bottom, 2, 0);
    PortAnchor last = PortDistributor::distributeOnSide(PortSide::Bottom, 2, 1);
    EXPECT_FLOAT_EQ(first.x, 0.15f);
    EXPECT_FLOAT_EQ(last.x, 0.85f);
    EXPECT_FLOAT_EQ(first.y, 1.0f);
}

// ============================================================================
// Batches
// ============================================================================

class PortDistributorBatchTest : public ::testing::Test {
protected:
    std::unordered_map<NodeId, Rect> bounds{
        {0, {0, 100, 100, 60}},
        {1, {400, 0, 100, 60}},
        {2, {400, 100, 100, 60}},
        {3, {400, 200, 100, 60}},
    };
};

TEST_F(PortDistributorBatchTest, FanOut_SpreadsExitsByTargetPosition) {
    auto result = PortDistributor::distributeForBatch({{0, 1}, {0, 2}, {0, 3}}, bounds);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_FLOAT_EQ(result[0].exit.x, 1.0f);
    EXPECT_FLOAT_EQ(result[0].exit.y, 0.15f);
    EXPECT_FLOAT_EQ(result[1].exit.y, 0.5f);
    EXPECT_FLOAT_EQ(result[2].exit.y, 0.85f);

    for (const auto& a : result) {
        EXPECT_EQ(a.entry, (PortAnchor{0.0f, 0.5f}));
    }
}

TEST_F(PortDistributorBatchTest, FanOut_InputOrderDoesNotMatter) {
    auto result = PortDistributor::distributeForBatch({{0, 3}, {0, 1}, {0, 2}}, bounds);

    EXPECT_FLOAT_EQ(result[0].exit.y, 0.85f);
    EXPECT_FLOAT_EQ(result[1].exit.y, 0.15f);
    EXPECT_FLOAT_EQ(result[2].exit.y, 0.5f);
}

TEST_F(PortDistributorBatchTest, FanIn_SpreadsEntries) {
    auto result = PortDistributor::distributeForBatch({{2, 0}, {1, 0}}, bounds);

    EXPECT_FLOAT_EQ(result[1].entry.x, 1.0f);
    EXPECT_FLOAT_EQ(result[1].entry.y, 0.15f);
    EXPECT_FLOAT_EQ(result[0].entry.y, 0.85f);
}

TEST_F(PortDistributorBatchTest, MissingBounds_UseRightToLeft) {
    auto result = PortDistributor::distributeForBatch({{0, 9}}, bounds);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].exit, (PortAnchor{1.0f, 0.5f}));
    EXPECT_EQ(result[0].entry, (PortAnchor{0.0f, 0.5f}));
}

TEST(PortDistributorDiagramTest, ApplyToDiagram_StoresAnchors) {
    Diagram diagram;
    NodeId a = diagram.addNode("A", {0, 100, 100, 60});
    NodeId b = diagram.addNode("B", {400, 0, 100, 60});
    NodeId c = diagram.addNode("C", {400, 200, 100, 60});
    EdgeId ab = diagram.addConnector(a, b);
    EdgeId ac = diagram.addConnector(a, c);

    int updated = PortDistributor::applyToDiagram(diagram, {ab, ac, 50});

    EXPECT_EQ(updated, 2);
    ASSERT_TRUE(diagram.getConnector(ab).exitPort.has_value());
    EXPECT_FLOAT_EQ(diagram.getConnector(ab).exitPort->y, 0.15f);
    EXPECT_FLOAT_EQ(diagram.getConnector(ac).exitPort->y, 0.85f);
    ASSERT_TRUE(diagram.getConnector(ac).entryPort.has_value());
    EXPECT_EQ(*diagram.getConnector(ac).entryPort, (PortAnchor{0.0f, 0.5f}));
}
