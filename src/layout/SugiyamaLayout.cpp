#include "orthograph/layout/SugiyamaLayout.h"
#include "orthograph/layout/LayeredGraph.h"
#include "orthograph/layout/EdgeRouter.h"
#include "orthograph/layout/OverlapResolver.h"
#include "orthograph/layout/api/ICycleRemoval.h"
#include "orthograph/layout/api/ILayerAssignment.h"
#include "orthograph/layout/api/ICrossingMinimization.h"
#include "orthograph/layout/api/ICoordinateAssignment.h"
#include "orthograph/layout/api/IPathFinder.h"
#include "orthograph/layout/util/LabelMetrics.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"
#include "sugiyama/phases/CycleRemoval.h"
#include "sugiyama/phases/LayerAssignment.h"
#include "sugiyama/phases/VirtualNodeExpansion.h"
#include "sugiyama/phases/CrossingMinimization.h"
#include "sugiyama/phases/RankEqualization.h"
#include "sugiyama/phases/CoordinateAssignment.h"
#include "pathfinding/AStarPathFinder.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace orthograph {

SugiyamaLayout::SugiyamaLayout()
    : SugiyamaLayout(LayoutOptions{}) {}

SugiyamaLayout::SugiyamaLayout(const LayoutOptions& options)
    : options_(options)
    , cycleRemoval_(std::make_shared<algorithms::CycleRemoval>())
    , layerAssignment_(std::make_shared<algorithms::LongestPathLayerAssignment>())
    , crossingMinimization_(std::make_shared<algorithms::BarycenterCrossingMinimization>())
    , coordinateAssignment_(std::make_shared<algorithms::SimpleCoordinateAssignment>())
    , pathFinder_(std::make_shared<algorithms::AStarPathFinder>()) {}

SugiyamaLayout::~SugiyamaLayout() = default;

SugiyamaLayout::SugiyamaLayout(SugiyamaLayout&&) noexcept = default;
SugiyamaLayout& SugiyamaLayout::operator=(SugiyamaLayout&&) noexcept = default;

void SugiyamaLayout::setCycleRemoval(std::shared_ptr<ICycleRemoval> impl) {
    if (impl) cycleRemoval_ = std::move(impl);
}

void SugiyamaLayout::setLayerAssignment(std::shared_ptr<ILayerAssignment> impl) {
    if (impl) layerAssignment_ = std::move(impl);
}

void SugiyamaLayout::setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void SugiyamaLayout::setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

void SugiyamaLayout::setPathFinder(std::shared_ptr<IPathFinder> impl) {
    if (impl) pathFinder_ = std::move(impl);
}

void SugiyamaLayout::runPipeline(LayeredGraph& graph) {
    // Phase 1: Cycle Removal
    auto cycles = cycleRemoval_->removeCycles(graph);
    stats_.reversedEdges = static_cast<int>(cycles.reversedEdges.size());

    // Phase 2: Layer Assignment
    auto ranks = layerAssignment_->assignRanks(graph);
    stats_.layerCount = ranks.layerCount;
    if (ranks.seededArbitrarily) {
        LOG_DEBUG("no source node, ranks seeded from '{}'", graph.node(0).key);
    }

    // Phase 3: Virtual nodes
    stats_.virtualNodes = static_cast<int>(algorithms::VirtualNodeExpansion::expand(graph));

    // Phase 4: Crossing Minimization
    auto crossings = crossingMinimization_->minimize(graph, options_.crossingMinimizationPasses);
    stats_.edgeCrossings = crossings.crossingCount;

    // Phase 5: Rank equalization
    stats_.equalizedNodes = algorithms::RankEqualization::equalize(graph, options_.direction);

    // Phase 6: Coordinate Assignment
    coordinateAssignment_->assignCoordinates(graph, options_);

    // Phase 7: Overlap removal on real nodes
    std::vector<size_t> real;
    std::vector<Rect> boxes;
    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        const LayerNode& n = graph.node(i);
        if (n.isVirtual) continue;
        real.push_back(i);
        boxes.push_back(Rect{n.position.x, n.position.y, n.size.width, n.size.height});
    }
    auto overlap = OverlapResolver::resolve(boxes, options_.overlapPadding, options_.gridSize,
                                            options_.maxOverlapIterations);
    stats_.overlapIterations = overlap.iterations;
    stats_.overlapConverged = overlap.converged;
    for (size_t k = 0; k < real.size(); ++k) {
        graph.node(real[k]).position = boxes[k].position();
    }

    LOG_DEBUG("{} layers, {} reversed, {} virtual, {} crossings ({} / {} / {})",
              stats_.layerCount, stats_.reversedEdges, stats_.virtualNodes, stats_.edgeCrossings,
              cycleRemoval_->algorithmName(), layerAssignment_->algorithmName(),
              crossingMinimization_->algorithmName());
}

LayoutResult SugiyamaLayout::layout(Diagram& diagram,
                                    const std::vector<EdgeSpec>& edges,
                                    const std::unordered_map<std::string, std::string>& nodeStyles,
                                    const std::string& connectorStyle) {
    stats_ = LayoutStats{};
    LayoutResult result;
    if (edges.empty()) {
        return result;
    }

    LayeredGraph graph;
    const Size defaultSize = options_.defaultNodeSize();
    auto ensureNode = [&graph, &defaultSize](const std::string& label) {
        if (auto existing = graph.indexOf(label)) return *existing;
        return graph.addNode(label, LabelMetrics::estimateNodeSize(label, defaultSize));
    };
    for (const auto& e : edges) {
        size_t s = ensureNode(e.source);
        size_t t = ensureNode(e.target);
        graph.addEdge(s, t, e.label);
    }

    runPipeline(graph);

    // Order within rank after crossing minimization
    std::vector<int> orderOf(graph.nodeCount(), 0);
    for (const auto& rank : graph.ranks()) {
        for (size_t i = 0; i < rank.size(); ++i) {
            orderOf[rank[i]] = static_cast<int>(i);
        }
    }

    // Create nodes
    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        LayerNode& n = graph.node(i);
        if (n.isVirtual) continue;

        auto styleIt = nodeStyles.find(n.key);
        const std::string& style = styleIt != nodeStyles.end() ? styleIt->second
                                                                : std::string(styles::DEFAULT_NODE);
        Point pos = grid::snapToGrid(n.position, options_.gridSize);
        n.cellId = diagram.addNode(n.key, Rect{pos.x, pos.y, n.size.width, n.size.height}, style);

        NodeLayout nl;
        nl.id = n.cellId;
        nl.label = n.key;
        nl.position = pos;
        nl.size = n.size;
        nl.layer = n.rank;
        nl.order = orderOf[i];
        result.setNodeLayout(n.cellId, nl);
    }

    // One connector per input edge
    for (size_t e = 0; e < graph.edgeCount(); ++e) {
        LayerEdge& edge = graph.edge(e);
        edge.connector = diagram.addConnector(graph.node(edge.source).cellId,
                                              graph.node(edge.target).cellId,
                                              edge.label, connectorStyle);
        result.addConnector(edge.connector);
    }
    result.setLayerCount(stats_.layerCount);

    if (options_.routeEdges) {
        stats_.routedConnectors = routeConnectors(diagram, result.connectors());
    }

    LOG_INFO("layered layout: {} nodes, {} connectors, {} layers",
             result.nodeCount(), result.connectorCount(), result.layerCount());
    return result;
}

std::vector<NodeId> SugiyamaLayout::relayout(Diagram& diagram) {
    stats_ = LayoutStats{};

    const std::vector<NodeId> topLevel = diagram.topLevelNodes();
    if (topLevel.empty()) {
        return {};
    }

    LayeredGraph graph;
    std::unordered_map<NodeId, size_t> indexOf;
    for (NodeId id : topLevel) {
        const Rect& geom = diagram.getNode(id).geometry;
        size_t idx = graph.addNode(std::to_string(id), Size{geom.width, geom.height});
        graph.node(idx).cellId = id;
        indexOf[id] = idx;
    }

    for (EdgeId cid : diagram.connectors()) {
        const ConnectorData& c = diagram.getConnector(cid);
        auto s = indexOf.find(c.source);
        auto t = indexOf.find(c.target);
        if (s == indexOf.end() || t == indexOf.end()) continue;
        size_t e = graph.addEdge(s->second, t->second, c.label);
        graph.edge(e).connector = cid;
    }

    if (graph.edgeCount() == 0) {
        LOG_DEBUG("relayout: no connectors between top-level nodes, using grid");
        return relayoutGrid(diagram, topLevel);
    }

    runPipeline(graph);

    std::vector<NodeId> moved;
    moved.reserve(topLevel.size());
    for (const LayerNode& n : graph.nodes()) {
        if (n.isVirtual) continue;
        Point pos = grid::snapToGrid(n.position, options_.gridSize);
        diagram.setNodeGeometry(n.cellId, Rect{pos.x, pos.y, n.size.width, n.size.height});
        moved.push_back(n.cellId);
    }

    if (options_.routeEdges) {
        stats_.routedConnectors = routeConnectors(diagram, diagram.connectors());
    }

    LOG_INFO("relayout: {} nodes repositioned", moved.size());
    return moved;
}

std::vector<NodeId> SugiyamaLayout::relayoutGrid(Diagram& diagram, const std::vector<NodeId>& nodes) const {
    const size_t cols = std::max<size_t>(1, static_cast<size_t>(std::sqrt(static_cast<double>(nodes.size()))));

    for (size_t i = 0; i < nodes.size(); ++i) {
        const Rect geom = diagram.getNode(nodes[i]).geometry;
        auto col = static_cast<float>(i % cols);
        auto row = static_cast<float>(i / cols);
        float x = grid::snapToGrid(options_.startX + col * (geom.width + options_.nodeSpacing), options_.gridSize);
        float y = grid::snapToGrid(options_.startY + row * (geom.height + options_.rankSpacing), options_.gridSize);
        diagram.setNodePosition(nodes[i], Point{x, y});
    }
    return nodes;
}

int SugiyamaLayout::routeConnectors(Diagram& diagram, const std::vector<EdgeId>& connectors) const {
    RouterOptions routerOptions;
    routerOptions.margin = options_.edgeMargin;
    routerOptions.gridSize = options_.gridSize;
    EdgeRouter router(routerOptions);
    router.setPathFinder(pathFinder_);
    return router.routeConnectors(diagram, connectors, options_.edgeMargin);
}

}  // namespace orthograph
