#include "VirtualNodeExpansion.h"

namespace orthograph {
namespace algorithms {

size_t VirtualNodeExpansion::expand(LayeredGraph& graph) {
    size_t inserted = 0;

    const size_t edgeCount = graph.edgeCount();
    for (size_t e = 0; e < edgeCount; ++e) {
        const LayerEdge& edge = graph.edge(e);
        if (edge.isSelfLoop()) continue;

        size_t upper = edge.effectiveSource();
        size_t lower = edge.effectiveTarget();
        int fromRank = graph.node(upper).rank;
        int toRank = graph.node(lower).rank;

        size_t prev = upper;
        for (int r = fromRank + 1; r < toRank; ++r) {
            size_t v = graph.addVirtualNode(r);
            graph.addSegment(prev, v);
            prev = v;
            ++inserted;
        }
        graph.addSegment(prev, lower);
    }

    graph.buildRankBuckets();
    return inserted;
}

}  // namespace algorithms
}  // namespace orthograph
