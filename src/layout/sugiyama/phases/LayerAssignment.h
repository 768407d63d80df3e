#pragma once

#include "orthograph/layout/api/ILayerAssignment.h"

namespace orthograph {
namespace algorithms {

/// Longest-path rank assignment by breadth-first relaxation.
///
/// Sources (no effective predecessor) start at rank 0 in arena order; a node
/// is re-queued whenever a predecessor pushes its rank higher. If no source
/// exists the first node seeds the search. Nodes never reached get rank 0.
class LongestPathLayerAssignment : public ILayerAssignment {
public:
    LongestPathLayerAssignment() = default;

    const char* algorithmName() const override { return "LongestPath"; }

    LayerAssignmentResult assignRanks(LayeredGraph& graph) const override;
};

}  // namespace algorithms
}  // namespace orthograph
