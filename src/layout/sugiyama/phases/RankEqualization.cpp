#include "RankEqualization.h"

#include <algorithm>

namespace orthograph {
namespace algorithms {

int RankEqualization::equalize(LayeredGraph& graph, Direction direction) {
    const bool vertical = isVertical(direction);
    int changed = 0;

    for (const auto& rank : graph.ranks()) {
        float extent = 0.0f;
        int realCount = 0;
        for (size_t n : rank) {
            const LayerNode& node = graph.node(n);
            if (node.isVirtual) continue;
            extent = std::max(extent, vertical ? node.size.height : node.size.width);
            ++realCount;
        }
        if (realCount < 2) continue;

        for (size_t n : rank) {
            LayerNode& node = graph.node(n);
            if (node.isVirtual) continue;
            float& dim = vertical ? node.size.height : node.size.width;
            if (dim != extent) {
                dim = extent;
                ++changed;
            }
        }
    }
    return changed;
}

}  // namespace algorithms
}  // namespace orthograph
