#include <gtest/gtest.h>
#include <orthograph/core/GeometryUtils.h>
#include <orthograph/orthograph.h>
#include <orthograph/layout/LayeredGraph.h>
#include <orthograph/layout/api/ILayerAssignment.h>

using namespace orthograph;

namespace {

const NodeLayout& layoutOf(const LayoutResult& result, const std::string& label) {
    auto id = result.nodeFor(label);
    EXPECT_TRUE(id.has_value()) << "no node for " << label;
    return *result.getNodeLayout(*id);
}

}  // namespace

// ============================================================================
// SugiyamaLayoutTest - 계층 레이아웃 테스트
// ============================================================================

// --- Basic Layout ---

TEST(SugiyamaLayoutTest, EmptyEdgeList_ReturnsEmptyResult) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram, {});

    EXPECT_EQ(result.nodeCount(), 0u);
    EXPECT_EQ(result.connectorCount(), 0u);
    EXPECT_EQ(diagram.nodeCount(), 0u);
}

TEST(SugiyamaLayoutTest, FanOut_PlacesChildrenSideBySide) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram, {{"A", "B"}, {"A", "C"}, {"A", "D"}});

    EXPECT_EQ(result.nodeCount(), 4u);
    EXPECT_EQ(result.connectorCount(), 3u);
    EXPECT_EQ(result.layerCount(), 2);
    EXPECT_EQ(diagram.nodeCount(), 4u);

    const auto& a = layoutOf(result, "A");
    const auto& b = layoutOf(result, "B");
    const auto& c = layoutOf(result, "C");
    const auto& d = layoutOf(result, "D");

    EXPECT_EQ(a.layer, 0);
    EXPECT_EQ(b.layer, 1);
    EXPECT_EQ(c.layer, 1);
    EXPECT_EQ(d.layer, 1);

    EXPECT_EQ(b.order, 0);
    EXPECT_EQ(c.order, 1);
    EXPECT_EQ(d.order, 2);

    EXPECT_EQ(b.position, Point(50, 240));
    EXPECT_EQ(c.position, Point(230, 240));
    EXPECT_EQ(d.position, Point(410, 240));
    // Parent centered over the widest rank
    EXPECT_EQ(a.position, Point(230, 80));

    EXPECT_FLOAT_EQ(b.size.height, 60.0f);
    EXPECT_EQ(diagram.getNode(a.id).geometry, a.bounds());
}

TEST(SugiyamaLayoutTest, Diamond_AssignsLongestPathLayers) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram,
        {{"A", "B"}, {"A", "C"}, {"B", "D"}, {"C", "D"}});

    const auto& a = layoutOf(result, "A");
    const auto& b = layoutOf(result, "B");
    const auto& c = layoutOf(result, "C");
    const auto& d = layoutOf(result, "D");

    EXPECT_LT(a.layer, b.layer);
    EXPECT_EQ(b.layer, c.layer);
    EXPECT_LT(c.layer, d.layer);
    EXPECT_EQ(result.layerCount(), 3);
    EXPECT_EQ(layout.lastStats().edgeCrossings, 0);
}

TEST(SugiyamaLayoutTest, Cycle_ReversesOneEdgeAndKeepsDirection) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram, {{"A", "B"}, {"B", "C"}, {"C", "A"}});

    EXPECT_EQ(layout.lastStats().reversedEdges, 1);
    EXPECT_EQ(layoutOf(result, "A").layer, 0);
    EXPECT_EQ(layoutOf(result, "B").layer, 1);
    EXPECT_EQ(layoutOf(result, "C").layer, 2);

    // The closing connector still points C -> A
    const ConnectorData& closing = diagram.getConnector(result.connectors()[2]);
    EXPECT_EQ(closing.source, *result.nodeFor("C"));
    EXPECT_EQ(closing.target, *result.nodeFor("A"));
}

TEST(SugiyamaLayoutTest, LongEdge_GetsVirtualNodes) {
    Diagram diagram;
    SugiyamaLayout layout;

    layout.layout(diagram, {{"A", "B"}, {"B", "C"}, {"A", "C"}});

    EXPECT_EQ(layout.lastStats().virtualNodes, 1);
    EXPECT_EQ(diagram.nodeCount(), 3u);
}

TEST(SugiyamaLayoutTest, SelfLoop_CreatesConnectorWithoutExtraLayer) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram, {{"A", "A"}, {"A", "B"}});

    EXPECT_EQ(result.layerCount(), 2);
    EXPECT_EQ(result.connectorCount(), 2u);
    // The loop is flagged by cycle removal and counted, but never ranked
    EXPECT_EQ(layout.lastStats().reversedEdges, 1);
    EXPECT_EQ(layout.lastStats().virtualNodes, 0);
}

TEST(SugiyamaLayoutTest, EdgeLabelsAndStylesAreApplied) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram, {{"A", "B", "uses"}},
                                        {{"B", "ellipse;html=1;"}}, "endArrow=open;");

    const ConnectorData& c = diagram.getConnector(result.connectors()[0]);
    EXPECT_EQ(c.label, "uses");
    EXPECT_EQ(c.style, "endArrow=open;");
    EXPECT_EQ(diagram.getNode(*result.nodeFor("B")).style, "ellipse;html=1;");
    EXPECT_EQ(diagram.getNode(*result.nodeFor("A")).style, styles::DEFAULT_NODE);
}

// --- Direction ---

TEST(SugiyamaLayoutTest, LeftToRight_StacksRanksHorizontally) {
    Diagram diagram;
    SugiyamaLayout layout(LayoutOptions{}.setDirection(Direction::LeftToRight));

    LayoutResult result = layout.layout(diagram, {{"A", "B"}});

    EXPECT_FLOAT_EQ(layoutOf(result, "A").position.x, 50.0f);
    EXPECT_FLOAT_EQ(layoutOf(result, "B").position.x, 270.0f);
    EXPECT_FLOAT_EQ(layoutOf(result, "A").position.y, layoutOf(result, "B").position.y);
}

TEST(SugiyamaLayoutTest, BottomToTop_PutsFirstRankAtTheBottom) {
    Diagram diagram;
    SugiyamaLayout layout(LayoutOptions{}.setDirection(Direction::BottomToTop));

    LayoutResult result = layout.layout(diagram, {{"A", "B"}});

    EXPECT_FLOAT_EQ(layoutOf(result, "A").position.y, 240.0f);
    EXPECT_FLOAT_EQ(layoutOf(result, "B").position.y, 80.0f);
}

// --- Sizing ---

TEST(SugiyamaLayoutTest, RankEqualization_UsesTallestNodeOfRank) {
    Diagram diagram;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(diagram,
        {{"Root", "Short"}, {"Root", "A much<br>longer<br>label<br>text"}});

    EXPECT_FLOAT_EQ(layoutOf(result, "Short").size.height, 104.0f);
    EXPECT_FLOAT_EQ(layoutOf(result, "A much<br>longer<br>label<br>text").size.height, 104.0f);
    EXPECT_FLOAT_EQ(layoutOf(result, "Root").size.height, 60.0f);
}

TEST(SugiyamaLayoutTest, RankEqualization_HorizontalLayoutsEqualizeWidth) {
    Diagram diagram;
    SugiyamaLayout layout(LayoutOptions{}.setDirection(Direction::LeftToRight));

    LayoutResult result = layout.layout(diagram,
        {{"Root", "x"}, {"Root", "A label wide enough to exceed the default width"}});

    float wide = layoutOf(result, "A label wide enough to exceed the default width").size.width;
    EXPECT_GT(wide, 120.0f);
    EXPECT_FLOAT_EQ(layoutOf(result, "x").size.width, wide);
}

// --- Invariants ---

TEST(SugiyamaLayoutTest, AllPositionsOnGridAndNoOverlap) {
    Diagram diagram;
    SugiyamaLayout layout;

    std::vector<EdgeSpec> edges = {
        {"Gateway", "Auth"}, {"Gateway", "Orders"}, {"Gateway", "Catalog"},
        {"Orders", "Payments"}, {"Orders", "Inventory"}, {"Catalog", "Inventory"},
        {"Payments", "Ledger"}, {"Auth", "Users"}, {"Users", "Ledger"},
        {"Inventory", "Warehouse with a long name"},
    };
    LayoutResult result = layout.layout(diagram, edges);

    std::vector<Rect> boxes;
    for (const auto& [id, nl] : result.nodeLayouts()) {
        EXPECT_TRUE(grid::isOnGrid(nl.position.x, 10.0f)) << nl.label;
        EXPECT_TRUE(grid::isOnGrid(nl.position.y, 10.0f)) << nl.label;
        boxes.push_back(nl.bounds());
    }
    for (size_t i = 0; i < boxes.size(); ++i) {
        for (size_t j = i + 1; j < boxes.size(); ++j) {
            EXPECT_FALSE(boxes[i].intersects(boxes[j]));
        }
    }

    for (const auto& [id, nl] : result.nodeLayouts()) {
        for (EdgeId e : result.connectors()) {
            const ConnectorData& c = diagram.getConnector(e);
            if (c.source == id && c.target != id) {
                EXPECT_LT(nl.layer, result.getNodeLayout(c.target)->layer);
            }
        }
    }
}

TEST(SugiyamaLayoutTest, RoutingCanBeDisabled) {
    Diagram diagram;
    SugiyamaLayout layout(LayoutOptions{}.setRouteEdges(false));

    layout.layout(diagram, {{"A", "B"}, {"A", "C"}});

    EXPECT_EQ(layout.lastStats().routedConnectors, 0);
}

TEST(SugiyamaLayoutTest, RoutesOnlyCreatedConnectors) {
    Diagram diagram;
    NodeId x = diagram.addNode("X", {900, 900, 120, 60});
    NodeId y = diagram.addNode("Y", {1200, 900, 120, 60});
    EdgeId existing = diagram.addConnector(x, y);
    diagram.setWaypoints(existing, {{1100, 800}});

    SugiyamaLayout layout;
    layout.layout(diagram, {{"A", "B"}, {"A", "C"}, {"A", "D"}});

    EXPECT_EQ(layout.lastStats().routedConnectors, 3);
    ASSERT_EQ(diagram.waypoints(existing).size(), 1u);
    EXPECT_EQ(diagram.waypoints(existing)[0], Point(1100, 800));
}

// --- Relayout ---

TEST(SugiyamaLayoutTest, Relayout_RepositionsConnectedNodes) {
    Diagram diagram;
    NodeId a = diagram.addNode("A", {500, 500, 120, 60});
    NodeId b = diagram.addNode("B", {0, 0, 120, 60});
    NodeId c = diagram.addNode("C", {300, 20, 120, 60});
    diagram.addConnector(a, b);
    diagram.addConnector(b, c);

    SugiyamaLayout layout;
    auto moved = layout.relayout(diagram);

    EXPECT_EQ(moved.size(), 3u);
    EXPECT_EQ(diagram.getNode(a).geometry.position(), Point(50, 80));
    EXPECT_EQ(diagram.getNode(b).geometry.position(), Point(50, 240));
    EXPECT_EQ(diagram.getNode(c).geometry.position(), Point(50, 400));
    EXPECT_EQ(layout.lastStats().layerCount, 3);
}

TEST(SugiyamaLayoutTest, Relayout_WithoutConnectorsUsesGrid) {
    Diagram diagram;
    std::vector<NodeId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(diagram.addNode("N" + std::to_string(i), {700.0f, 13.0f * i, 120, 60}));
    }

    SugiyamaLayout layout;
    auto moved = layout.relayout(diagram);

    ASSERT_EQ(moved.size(), 4u);
    EXPECT_EQ(diagram.getNode(ids[0]).geometry.position(), Point(50, 80));
    EXPECT_EQ(diagram.getNode(ids[1]).geometry.position(), Point(230, 80));
    EXPECT_EQ(diagram.getNode(ids[2]).geometry.position(), Point(50, 240));
    EXPECT_EQ(diagram.getNode(ids[3]).geometry.position(), Point(230, 240));
    EXPECT_EQ(layout.lastStats().routedConnectors, 0);
}

TEST(SugiyamaLayoutTest, Relayout_EmptyDiagram) {
    Diagram diagram;
    SugiyamaLayout layout;

    EXPECT_TRUE(layout.relayout(diagram).empty());
}

// --- Algorithm injection ---

namespace {

class FlatLayerAssignment : public ILayerAssignment {
public:
    LayerAssignmentResult assignRanks(LayeredGraph& graph) const override {
        for (auto& n : graph.nodes()) {
            n.rank = 0;
        }
        return {1, false};
    }
    const char* algorithmName() const override { return "Flat"; }
};

}  // namespace

TEST(SugiyamaLayoutTest, CustomLayerAssignmentIsUsed) {
    Diagram diagram;
    SugiyamaLayout layout;
    layout.setLayerAssignment(std::make_shared<FlatLayerAssignment>());

    LayoutResult result = layout.layout(diagram, {{"A", "B"}});

    EXPECT_EQ(result.layerCount(), 1);
    EXPECT_FLOAT_EQ(layoutOf(result, "A").position.y, layoutOf(result, "B").position.y);
}
