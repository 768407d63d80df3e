#include "LayerAssignment.h"

#include <algorithm>
#include <deque>

namespace orthograph {
namespace algorithms {

LayerAssignmentResult LongestPathLayerAssignment::assignRanks(LayeredGraph& graph) const {
    LayerAssignmentResult result;

    const size_t n = graph.nodeCount();
    if (n == 0) {
        return result;
    }

    std::vector<std::vector<size_t>> successors(n);
    std::vector<size_t> inDegree(n, 0);
    for (const auto& e : graph.edges()) {
        if (e.isSelfLoop()) continue;
        successors[e.effectiveSource()].push_back(e.effectiveTarget());
        ++inDegree[e.effectiveTarget()];
    }

    std::vector<size_t> sources;
    for (size_t i = 0; i < n; ++i) {
        if (inDegree[i] == 0) {
            sources.push_back(i);
        }
    }
    if (sources.empty()) {
        sources.push_back(0);
        result.seededArbitrarily = true;
    }

    constexpr int UNRANKED = -1;
    std::vector<int> rank(n, UNRANKED);
    std::deque<size_t> queue;
    for (size_t s : sources) {
        rank[s] = 0;
        queue.push_back(s);
    }

    while (!queue.empty()) {
        size_t u = queue.front();
        queue.pop_front();
        for (size_t v : successors[u]) {
            int candidate = rank[u] + 1;
            // Ranks beyond n-1 only occur on a leftover cycle
            if (candidate >= static_cast<int>(n)) continue;
            if (rank[v] < candidate) {
                rank[v] = candidate;
                queue.push_back(v);
            }
        }
    }

    int maxRank = 0;
    for (size_t i = 0; i < n; ++i) {
        graph.node(i).rank = rank[i] == UNRANKED ? 0 : rank[i];
        maxRank = std::max(maxRank, graph.node(i).rank);
    }

    result.layerCount = maxRank + 1;
    return result;
}

}  // namespace algorithms
}  // namespace orthograph
