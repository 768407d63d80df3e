#pragma once

#include "orthograph/layout/api/ICycleRemoval.h"

#include <vector>

namespace orthograph {
namespace algorithms {

/// DFS-based cycle removal.
///
/// Visits nodes in arena order and follows each node's out-edges in input
/// order with an explicit stack (no recursion, so deep chains are safe).
/// An edge that reaches a node still on the stack is a back-edge.
class CycleRemoval : public ICycleRemoval {
public:
    CycleRemoval() = default;

    const char* algorithmName() const override { return "DFS"; }

    CycleRemovalResult removeCycles(LayeredGraph& graph) const override;

private:
    enum class NodeState { White, Gray, Black };
};

}  // namespace algorithms
}  // namespace orthograph
