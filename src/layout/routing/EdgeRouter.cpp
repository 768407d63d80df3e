#include "orthograph/layout/EdgeRouter.h"
#include "../pathfinding/AStarPathFinder.h"
#include "orthograph/common/Logger.h"

namespace orthograph {

EdgeRouter::EdgeRouter()
    : pathFinder_(std::make_shared<algorithms::AStarPathFinder>()) {}

EdgeRouter::EdgeRouter(const RouterOptions& options)
    : options_(options), pathFinder_(std::make_shared<algorithms::AStarPathFinder>()) {}

void EdgeRouter::setPathFinder(std::shared_ptr<IPathFinder> impl) {
    if (impl) pathFinder_ = std::move(impl);
}

RouteResult EdgeRouter::route(const Rect& source, const Rect& target,
                              const std::vector<Rect>& obstacles) const {
    return pathFinder_->findRoute(source, target, obstacles, options_);
}

int EdgeRouter::routeAll(Diagram& diagram, float margin) {
    return routeConnectors(diagram, diagram.connectors(), margin);
}

int EdgeRouter::routeConnectors(Diagram& diagram, const std::vector<EdgeId>& connectors,
                                float margin) {
    stats_ = RoutingStats{};

    RouterOptions opts = options_;
    opts.margin = margin;
    opts.gridSize = diagram.gridSize();

    const auto bounds = diagram.allAbsoluteBounds();
    const std::vector<NodeId> nodeIds = diagram.nodes();

    int routed = 0;
    for (EdgeId id : connectors) {
        if (!diagram.hasConnector(id)) {
            ++stats_.skipped;
            continue;
        }
        const ConnectorData& c = diagram.getConnector(id);
        auto src = bounds.find(c.source);
        auto tgt = bounds.find(c.target);
        if (src == bounds.end() || tgt == bounds.end()) {
            LOG_DEBUG("connector {} skipped: endpoint {} or {} has no bounds", id, c.source, c.target);
            ++stats_.skipped;
            continue;
        }

        std::vector<Rect> obstacles;
        obstacles.reserve(nodeIds.size());
        for (NodeId n : nodeIds) {
            if (n == c.source || n == c.target) continue;
            if (diagram.isAncestorOf(n, c.source) || diagram.isAncestorOf(n, c.target)) continue;
            if (diagram.isAncestorOf(c.source, n) || diagram.isAncestorOf(c.target, n)) continue;
            obstacles.push_back(bounds.at(n));
        }

        RouteResult result = pathFinder_->findRoute(src->second, tgt->second, obstacles, opts);
        stats_.expansions += result.expansions;
        switch (result.kind) {
            case RouteKind::Direct: ++stats_.direct; break;
            case RouteKind::Searched: ++stats_.searched; break;
            case RouteKind::Fallback: ++stats_.fallback; break;
        }

        diagram.setWaypoints(id, std::move(result.waypoints));
        ++routed;
    }

    LOG_DEBUG("routed {} connectors ({} direct, {} searched, {} fallback, {} skipped)",
              routed, stats_.direct, stats_.searched, stats_.fallback, stats_.skipped);
    return routed;
}

}  // namespace orthograph
