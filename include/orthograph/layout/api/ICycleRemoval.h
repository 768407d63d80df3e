#pragma once

#include "../LayeredGraph.h"

#include <vector>

namespace orthograph {

/// Result of cycle removal
struct CycleRemovalResult {
    std::vector<size_t> reversedEdges;  ///< Indices into LayeredGraph::edges()
    bool isAcyclic = true;              ///< True when nothing had to be reversed
};

/// Strategy that makes the effective edge set acyclic.
///
/// Implementations flag back-edges with LayerEdge::reversed; they never drop
/// or re-point an edge, so caller-visible direction is preserved.
class ICycleRemoval {
public:
    virtual ~ICycleRemoval() = default;

    /// Flag back-edges in graph
    /// @param graph Arena with nodes and edges, reversed flags are overwritten
    /// @return Edges that were flagged
    virtual CycleRemovalResult removeCycles(LayeredGraph& graph) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace orthograph
