#include "CoordinateAssignment.h"

#include <algorithm>

namespace orthograph {
namespace algorithms {

namespace {

/// Extent along the rank axis
float primaryExtent(const LayerNode& n, bool vertical) {
    return vertical ? n.size.height : n.size.width;
}

/// Extent along the cross axis
float crossExtent(const LayerNode& n, bool vertical) {
    return vertical ? n.size.width : n.size.height;
}

}  // namespace

std::vector<float> SimpleCoordinateAssignment::computeRankOffsets(
    const LayeredGraph& graph, const LayoutOptions& options) const {

    const bool vertical = isVertical(options.direction);
    const auto& ranks = graph.ranks();
    const float fallback = vertical ? options.defaultNodeHeight : options.defaultNodeWidth;

    std::vector<float> maxExtent(ranks.size(), 0.0f);
    for (size_t r = 0; r < ranks.size(); ++r) {
        bool hasReal = false;
        for (size_t n : ranks[r]) {
            const LayerNode& node = graph.node(n);
            if (node.isVirtual) continue;
            maxExtent[r] = std::max(maxExtent[r], primaryExtent(node, vertical));
            hasReal = true;
        }
        if (!hasReal) {
            maxExtent[r] = fallback;
        }
    }

    const bool reversed = options.direction == Direction::BottomToTop ||
                          options.direction == Direction::RightToLeft;
    std::vector<float> offsets(ranks.size(), 0.0f);
    float cursor = vertical ? options.startY : options.startX;
    for (size_t i = 0; i < ranks.size(); ++i) {
        size_t r = reversed ? ranks.size() - 1 - i : i;
        offsets[r] = cursor;
        cursor += maxExtent[r] + options.rankSpacing;
    }
    return offsets;
}

void SimpleCoordinateAssignment::assignCoordinates(
    LayeredGraph& graph, const LayoutOptions& options) const {

    const auto& ranks = graph.ranks();
    if (ranks.empty()) return;

    const bool vertical = isVertical(options.direction);
    const std::vector<float> offsets = computeRankOffsets(graph, options);

    // Cross-axis length of every rank's real nodes
    std::vector<float> rankLength(ranks.size(), 0.0f);
    float widest = 0.0f;
    for (size_t r = 0; r < ranks.size(); ++r) {
        int realCount = 0;
        for (size_t n : ranks[r]) {
            const LayerNode& node = graph.node(n);
            if (node.isVirtual) continue;
            rankLength[r] += crossExtent(node, vertical);
            ++realCount;
        }
        if (realCount > 1) {
            rankLength[r] += static_cast<float>(realCount - 1) * options.nodeSpacing;
        }
        widest = std::max(widest, rankLength[r]);
    }

    const float crossStart = vertical ? options.startX : options.startY;
    for (size_t r = 0; r < ranks.size(); ++r) {
        float cursor = crossStart + (widest - rankLength[r]) / 2.0f;
        for (size_t n : ranks[r]) {
            LayerNode& node = graph.node(n);
            if (vertical) {
                node.position = {cursor, offsets[r]};
            } else {
                node.position = {offsets[r], cursor};
            }
            if (!node.isVirtual) {
                cursor += crossExtent(node, vertical) + options.nodeSpacing;
            }
        }
    }
}

}  // namespace algorithms
}  // namespace orthograph
