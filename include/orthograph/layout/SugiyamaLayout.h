#pragma once

#include "../core/Diagram.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace orthograph {

class LayeredGraph;

// Interfaces
class ICycleRemoval;
class ILayerAssignment;
class ICrossingMinimization;
class ICoordinateAssignment;
class IPathFinder;

/// Directed edge between two labels
struct EdgeSpec {
    std::string source;
    std::string target;
    std::string label;
};

/// Sugiyama-style layered layout
///
/// 1. Cycle Removal - flag back-edges (DFS)
/// 2. Layer Assignment - longest path ranks
/// 3. Virtual nodes - split edges spanning several ranks
/// 4. Crossing Minimization - barycenter sweeps
/// 5. Rank equalization - uniform height (rows) or width (columns) per rank
/// 6. Coordinate Assignment - stacked ranks, centered against the widest
/// 7. Overlap removal
/// 8. Output - nodes and connectors on the diagram, optional routing
class SugiyamaLayout {
public:
    SugiyamaLayout();
    explicit SugiyamaLayout(const LayoutOptions& options);
    ~SugiyamaLayout();

    // Non-copyable, movable
    SugiyamaLayout(const SugiyamaLayout&) = delete;
    SugiyamaLayout& operator=(const SugiyamaLayout&) = delete;
    SugiyamaLayout(SugiyamaLayout&&) noexcept;
    SugiyamaLayout& operator=(SugiyamaLayout&&) noexcept;

    void setOptions(const LayoutOptions& options) { options_ = options; }
    const LayoutOptions& options() const { return options_; }

    /// Lay out a graph given as an edge list and add it to the diagram.
    /// One node is created per distinct label (in first-appearance order),
    /// sized from its label text, and one connector per input edge.
    /// @param nodeStyles Per-label style overrides
    /// @param connectorStyle Style of every created connector
    LayoutResult layout(Diagram& diagram,
                        const std::vector<EdgeSpec>& edges,
                        const std::unordered_map<std::string, std::string>& nodeStyles = {},
                        const std::string& connectorStyle = styles::LAYERED_CONNECTOR);

    /// Reposition the top-level nodes of an existing diagram in place.
    /// Connectors between two top-level nodes drive the layout; without any,
    /// nodes are arranged in a grid. Existing sizes are kept except for rank
    /// equalization.
    /// @return Repositioned nodes
    std::vector<NodeId> relayout(Diagram& diagram);

    /// Statistics from the last layout()/relayout()
    struct LayoutStats {
        int layerCount = 0;
        int reversedEdges = 0;      ///< Back-edges flagged, self-loops included
        int virtualNodes = 0;
        int edgeCrossings = 0;
        int equalizedNodes = 0;
        int overlapIterations = 0;
        bool overlapConverged = true;
        int routedConnectors = 0;
    };
    const LayoutStats& lastStats() const { return stats_; }

    /// Algorithm injection (nullptr keeps the current implementation)
    void setCycleRemoval(std::shared_ptr<ICycleRemoval> impl);
    void setLayerAssignment(std::shared_ptr<ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl);
    void setPathFinder(std::shared_ptr<IPathFinder> impl);

private:
    LayoutOptions options_;
    LayoutStats stats_;

    std::shared_ptr<ICycleRemoval> cycleRemoval_;
    std::shared_ptr<ILayerAssignment> layerAssignment_;
    std::shared_ptr<ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<ICoordinateAssignment> coordinateAssignment_;
    std::shared_ptr<IPathFinder> pathFinder_;

    /// Phases 1-7 on a populated arena
    void runPipeline(LayeredGraph& graph);

    /// Grid arrangement for diagrams without usable connectors
    std::vector<NodeId> relayoutGrid(Diagram& diagram, const std::vector<NodeId>& nodes) const;

    int routeConnectors(Diagram& diagram, const std::vector<EdgeId>& connectors) const;
};

}  // namespace orthograph
