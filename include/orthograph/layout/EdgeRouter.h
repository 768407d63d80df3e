#pragma once

#include "../core/Diagram.h"
#include "api/IPathFinder.h"
#include "config/LayoutOptions.h"

#include <memory>
#include <vector>

namespace orthograph {

/// Obstacle-aware orthogonal routing for diagram connectors.
///
/// For every connector the obstacles are all nodes except its two endpoints
/// and their containers/descendants. Waypoints are written back for each
/// connector that could be routed; connectors whose endpoints have no box
/// are skipped.
class EdgeRouter {
public:
    /// Counters for the last routeAll()/routeConnectors() call
    struct RoutingStats {
        int direct = 0;
        int searched = 0;
        int fallback = 0;
        int skipped = 0;
        int expansions = 0;
    };

    EdgeRouter();
    explicit EdgeRouter(const RouterOptions& options);

    void setOptions(const RouterOptions& options) { options_ = options; }
    const RouterOptions& options() const { return options_; }

    /// Replace the routing algorithm (nullptr keeps the current one)
    void setPathFinder(std::shared_ptr<IPathFinder> impl);

    /// Route a single connection between two boxes
    RouteResult route(const Rect& source, const Rect& target,
                      const std::vector<Rect>& obstacles) const;

    /// Reroute every connector of the diagram
    /// @param margin Clearance around shapes
    /// @return Number of connectors routed
    int routeAll(Diagram& diagram, float margin = 15.0f);

    /// Reroute only the given connectors (unknown ids are skipped)
    int routeConnectors(Diagram& diagram, const std::vector<EdgeId>& connectors, float margin);

    const RoutingStats& lastStats() const { return stats_; }

private:
    RouterOptions options_;
    std::shared_ptr<IPathFinder> pathFinder_;
    RoutingStats stats_;
};

}  // namespace orthograph
