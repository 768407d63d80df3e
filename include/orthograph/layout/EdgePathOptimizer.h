#pragma once

#include "../core/Diagram.h"
#include "config/LayoutOptions.h"

#include <vector>

namespace orthograph {

/// Post-routing cleanup of connector waypoints.
///
/// Per connector: collinear removal, straightening, detour shortening and
/// channel centering. Across connectors: parallel segment separation.
/// The pipeline is repeated (at most MAX_ROUNDS times) until a round leaves
/// every path unchanged, so optimizing an optimized diagram is a no-op.
class EdgePathOptimizer {
public:
    static constexpr int MAX_ROUNDS = 3;

    struct OptimizationStats {
        int examined = 0;          ///< Connectors with waypoints and known endpoints
        int modified = 0;          ///< Connectors whose waypoint list changed
        int waypointsRemoved = 0;  ///< Net waypoint reduction
        int segmentsSeparated = 0;
        int rounds = 0;
    };

    EdgePathOptimizer() = default;
    explicit EdgePathOptimizer(const OptimizerOptions& options) : options_(options) {}

    void setOptions(const OptimizerOptions& options) { options_ = options; }
    const OptimizerOptions& options() const { return options_; }

    /// Optimize all connectors of the diagram in place
    /// @return Number of connectors whose waypoints changed
    int optimize(Diagram& diagram);

    /// Optimize the given connectors only
    int optimizeConnectors(Diagram& diagram, const std::vector<EdgeId>& connectors);

    /// Run the per-connector passes on one full path
    /// (source center, waypoints..., target center). Grid snapping is not applied.
    std::vector<Point> optimizePath(const std::vector<Point>& path,
                                    const std::vector<Rect>& obstacles) const;

    const OptimizationStats& lastStats() const { return stats_; }

private:
    OptimizerOptions options_;
    OptimizationStats stats_;
};

}  // namespace orthograph
