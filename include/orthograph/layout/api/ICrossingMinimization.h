#pragma once

#include "../LayeredGraph.h"

namespace orthograph {

/// Result of crossing minimization
struct CrossingMinimizationResult {
    int crossingCount = 0;   ///< Segment crossings after the final sweep
    int passesRun = 0;
};

/// Strategy that reorders the rank buckets of an expanded graph.
///
/// Runs a bounded number of passes; it does not iterate to convergence.
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /// Reorder graph.ranks() in place and refresh LayerNode::order
    /// @param graph Expanded graph with rank buckets built
    /// @param passes Number of forward + backward sweep pairs
    virtual CrossingMinimizationResult minimize(LayeredGraph& graph, int passes) const = 0;

    /// Count crossings between unit-span segments for the current order
    virtual int countCrossings(const LayeredGraph& graph) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace orthograph
