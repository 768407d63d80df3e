#include "CycleRemoval.h"

#include <utility>

namespace orthograph {
namespace algorithms {

CycleRemovalResult CycleRemoval::removeCycles(LayeredGraph& graph) const {
    CycleRemovalResult result;

    const size_t n = graph.nodeCount();
    if (n == 0) {
        return result;
    }

    // Out-edge lists in input order, over caller-visible direction
    std::vector<std::vector<size_t>> outEdges(n);
    for (size_t e = 0; e < graph.edgeCount(); ++e) {
        LayerEdge& edge = graph.edge(e);
        edge.reversed = false;
        outEdges[edge.source].push_back(e);
    }

    std::vector<NodeState> state(n, NodeState::White);

    // Frame = (node, next out-edge position)
    std::vector<std::pair<size_t, size_t>> stack;
    for (size_t start = 0; start < n; ++start) {
        if (state[start] != NodeState::White) continue;

        state[start] = NodeState::Gray;
        stack.emplace_back(start, 0);

        while (!stack.empty()) {
            auto& [u, pos] = stack.back();
            if (pos >= outEdges[u].size()) {
                state[u] = NodeState::Black;
                stack.pop_back();
                continue;
            }

            size_t e = outEdges[u][pos++];
            size_t v = graph.edge(e).target;
            if (state[v] == NodeState::Gray) {
                graph.edge(e).reversed = true;
                result.reversedEdges.push_back(e);
            } else if (state[v] == NodeState::White) {
                state[v] = NodeState::Gray;
                stack.emplace_back(v, 0);
            }
        }
    }

    result.isAcyclic = result.reversedEdges.empty();
    return result;
}

}  // namespace algorithms
}  // namespace orthograph
