#include <gtest/gtest.h>
#include <orthograph/layout/EdgeRouter.h>

using namespace orthograph;

namespace {

/// Always answers with one fixed waypoint
class FixedPathFinder : public IPathFinder {
public:
    RouteResult findRoute(const Rect&, const Rect&, const std::vector<Rect>& obstacles,
                          const RouterOptions&) const override {
        lastObstacleCount = obstacles.size();
        RouteResult r;
        r.kind = RouteKind::Searched;
        r.waypoints = {{123, 456}};
        return r;
    }
    const char* algorithmName() const override { return "Fixed"; }

    mutable size_t lastObstacleCount = 0;
};

}  // namespace

class EdgeRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = diagram.addNode("Source", {-20, 80, 40, 40});
        target = diagram.addNode("Target", {380, 80, 40, 40});
        blocker = diagram.addNode("Blocker", {180, 80, 100, 100});
        connector = diagram.addConnector(source, target);
    }

    Diagram diagram;
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    NodeId blocker = INVALID_NODE;
    EdgeId connector = INVALID_EDGE;
};

TEST_F(EdgeRouterTest, RouteAll_WritesWaypointsAroundBlocker) {
    EdgeRouter router;

    int routed = router.routeAll(diagram, 15.0f);

    EXPECT_EQ(routed, 1);
    EXPECT_EQ(router.lastStats().searched, 1);
    const auto& wp = diagram.waypoints(connector);
    ASSERT_EQ(wp.size(), 2u);
    EXPECT_EQ(wp[0], Point(0, 60));
    EXPECT_EQ(wp[1], Point(400, 60));
}

TEST_F(EdgeRouterTest, EndpointsAreNeverObstacles) {
    diagram.removeNode(blocker);
    diagram.setWaypoints(connector, {{0, 300}, {400, 300}});
    EdgeRouter router;

    router.routeAll(diagram);

    EXPECT_EQ(router.lastStats().direct, 1);
    EXPECT_TRUE(diagram.waypoints(connector).empty());
}

TEST_F(EdgeRouterTest, EnclosingContainerIsNotAnObstacle) {
    diagram.removeNode(blocker);
    NodeId frame = diagram.addNode("Frame", {-100, 0, 700, 300});
    diagram.setParent(source, frame);
    diagram.setParent(target, frame);
    diagram.setNodePosition(source, {80, 80});
    diagram.setNodePosition(target, {480, 80});

    EdgeRouter router;
    router.routeAll(diagram);

    EXPECT_EQ(router.lastStats().direct, 1);
    EXPECT_TRUE(diagram.waypoints(connector).empty());
}

TEST_F(EdgeRouterTest, UnknownEndpoint_IsSkipped) {
    EdgeId dangling = diagram.addConnector(source, 99);
    diagram.setWaypoints(dangling, {{10, 10}});
    EdgeRouter router;

    int routed = router.routeAll(diagram);

    EXPECT_EQ(routed, 1);
    EXPECT_EQ(router.lastStats().skipped, 1);
    ASSERT_EQ(diagram.waypoints(dangling).size(), 1u);
}

TEST_F(EdgeRouterTest, RouteConnectors_OnlyTouchesGivenIds) {
    NodeId other = diagram.addNode("Other", {0, 400, 40, 40});
    EdgeId untouched = diagram.addConnector(source, other);
    diagram.setWaypoints(untouched, {{5, 5}});

    EdgeRouter router;
    int routed = router.routeConnectors(diagram, {connector, 77}, 15.0f);

    EXPECT_EQ(routed, 1);
    EXPECT_EQ(router.lastStats().skipped, 1);
    ASSERT_EQ(diagram.waypoints(untouched).size(), 1u);
    EXPECT_EQ(diagram.waypoints(untouched)[0], Point(5, 5));
}

TEST_F(EdgeRouterTest, CustomPathFinder_ReceivesObstacles) {
    auto finder = std::make_shared<FixedPathFinder>();
    EdgeRouter router;
    router.setPathFinder(finder);

    router.routeAll(diagram);

    EXPECT_EQ(finder->lastObstacleCount, 1u);
    ASSERT_EQ(diagram.waypoints(connector).size(), 1u);
    EXPECT_EQ(diagram.waypoints(connector)[0], Point(123, 456));
}

TEST_F(EdgeRouterTest, NullPathFinder_KeepsDefault) {
    EdgeRouter router;
    router.setPathFinder(nullptr);

    RouteResult r = router.route({-20, 80, 40, 40}, {380, 80, 40, 40}, {{180, 80, 100, 100}});

    EXPECT_EQ(r.kind, RouteKind::Searched);
}
