#pragma once

#include "../LayeredGraph.h"
#include "../config/LayoutOptions.h"

namespace orthograph {

/// Strategy that turns rank/order into absolute LayerNode::position.
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    /// @param graph Expanded graph with final rank order and sizes
    /// @param options Spacing, origin and direction
    virtual void assignCoordinates(LayeredGraph& graph, const LayoutOptions& options) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace orthograph
