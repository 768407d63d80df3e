#include "orthograph/layout/OverlapResolver.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"

#include <cmath>
#include <map>

namespace orthograph {

namespace {

/// Overlap extents of two boxes padded on their right/bottom edges.
/// Both positive means the boxes are closer than padding.
std::pair<float, float> computeOverlap(const Rect& a, const Rect& b, float padding) {
    float overlapX = std::min(a.right() + padding, b.right() + padding) - std::max(a.x, b.x);
    float overlapY = std::min(a.bottom() + padding, b.bottom() + padding) - std::max(a.y, b.y);
    return {overlapX, overlapY};
}

float quantize(float push, float quantum) {
    if (quantum <= 0.0f) return push;
    return std::ceil(push / quantum) * quantum;
}

}  // namespace

bool OverlapResolver::separationPass(std::vector<Rect>& boxes, float padding, float quantum) {
    bool moved = false;
    for (size_t i = 0; i < boxes.size(); ++i) {
        for (size_t j = i + 1; j < boxes.size(); ++j) {
            Rect& a = boxes[i];
            Rect& b = boxes[j];
            auto [overlapX, overlapY] = computeOverlap(a, b, padding);
            if (overlapX <= 0.0f || overlapY <= 0.0f) continue;

            if (overlapX <= overlapY) {
                float push = quantize(overlapX / 2.0f + 1.0f, quantum);
                float dir = a.centerX() < b.centerX() || a.centerX() == b.centerX() ? -1.0f : 1.0f;
                a.x += dir * push;
                b.x -= dir * push;
            } else {
                float push = quantize(overlapY / 2.0f + 1.0f, quantum);
                float dir = a.centerY() < b.centerY() || a.centerY() == b.centerY() ? -1.0f : 1.0f;
                a.y += dir * push;
                b.y -= dir * push;
            }
            moved = true;
        }
    }
    return moved;
}

OverlapStats OverlapResolver::resolve(std::vector<Rect>& boxes, float padding,
                                      float gridSize, int maxIterations) {
    OverlapStats stats;
    const float g = constants::effectiveGridSize(gridSize);
    float quantum = 0.0f;

    while (true) {
        while (stats.iterations < maxIterations) {
            ++stats.iterations;
            if (!separationPass(boxes, padding, quantum)) break;
        }

        for (auto& box : boxes) {
            box.x = grid::snapToGrid(box.x, g);
            box.y = grid::snapToGrid(box.y, g);
        }

        if (!hasOverlap(boxes, padding)) {
            stats.converged = true;
            break;
        }
        if (stats.iterations >= maxIterations) {
            break;
        }
        // Snapping pulled boxes back into contact; keep going on the grid
        quantum = g;
    }

    if (!stats.converged && boxes.size() > 1) {
        LOG_WARN("overlap removal stopped at the cap of {} iterations with overlap left ({} boxes)",
                 maxIterations, boxes.size());
    }
    return stats;
}

bool OverlapResolver::hasOverlap(const std::vector<Rect>& boxes, float padding) {
    for (size_t i = 0; i < boxes.size(); ++i) {
        for (size_t j = i + 1; j < boxes.size(); ++j) {
            if (boxes[i].intersects(boxes[j], padding)) {
                return true;
            }
        }
    }
    return false;
}

std::vector<OverlapPair> OverlapResolver::findOverlaps(const Diagram& diagram, float margin) {
    std::vector<OverlapPair> pairs;
    std::vector<NodeId> ids = diagram.nodes();
    auto bounds = diagram.allAbsoluteBounds();

    for (size_t i = 0; i < ids.size(); ++i) {
        for (size_t j = i + 1; j < ids.size(); ++j) {
            NodeId a = ids[i];
            NodeId b = ids[j];
            if (diagram.isAncestorOf(a, b) || diagram.isAncestorOf(b, a)) continue;
            if (bounds.at(a).intersects(bounds.at(b), margin)) {
                pairs.push_back({a, b});
            }
        }
    }
    return pairs;
}

int OverlapResolver::resolveOverlaps(Diagram& diagram, float margin, int maxIterations) {
    // Sibling groups keyed by parent, top level first
    std::map<NodeId, std::vector<NodeId>> groups;
    for (NodeId id : diagram.nodes()) {
        NodeId parent = diagram.getNode(id).parent;
        groups[parent == INVALID_NODE ? 0 : parent + 1].push_back(id);
    }

    int movedCount = 0;
    for (auto& [key, members] : groups) {
        if (members.size() < 2) continue;

        std::vector<Rect> boxes;
        boxes.reserve(members.size());
        for (NodeId id : members) {
            boxes.push_back(*diagram.absoluteBounds(id));
        }
        if (!hasOverlap(boxes, margin)) continue;
        const std::vector<Rect> before = boxes;

        OverlapStats stats = OverlapResolver::resolve(boxes, margin, diagram.gridSize(), maxIterations);
        LOG_DEBUG("group {}: {} nodes, {} iterations, converged={}",
                  key, members.size(), stats.iterations, stats.converged);

        for (size_t i = 0; i < members.size(); ++i) {
            float dx = boxes[i].x - before[i].x;
            float dy = boxes[i].y - before[i].y;
            if (dx == 0.0f && dy == 0.0f) continue;

            Rect g = diagram.getNode(members[i]).geometry;
            diagram.setNodePosition(members[i], {g.x + dx, g.y + dy});
            ++movedCount;
        }
    }
    return movedCount;
}

}  // namespace orthograph
