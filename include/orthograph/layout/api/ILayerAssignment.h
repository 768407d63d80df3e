#pragma once

#include "../LayeredGraph.h"

namespace orthograph {

/// Result of rank assignment
struct LayerAssignmentResult {
    int layerCount = 0;
    bool seededArbitrarily = false;   ///< No source node existed
};

/// Strategy that assigns LayerNode::rank to every real node.
///
/// Must guarantee rank(v) >= rank(u) + 1 for every effective, non-self-loop
/// edge u -> v.
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    virtual LayerAssignmentResult assignRanks(LayeredGraph& graph) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace orthograph
