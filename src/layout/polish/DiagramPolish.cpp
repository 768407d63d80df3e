#include "orthograph/layout/DiagramPolish.h"
#include "orthograph/layout/SugiyamaLayout.h"
#include "orthograph/layout/OverlapResolver.h"
#include "orthograph/layout/EdgeRouter.h"
#include "orthograph/layout/EdgePathOptimizer.h"
#include "orthograph/layout/util/LabelMetrics.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

namespace orthograph {

namespace {

/// Minimum shift worth applying during compaction
constexpr float COMPACT_MIN_SHIFT = 5.0f;

std::vector<NodeId> sortedBy(const std::vector<NodeId>& ids,
                             const std::function<float(NodeId)>& key) {
    std::vector<NodeId> sorted = ids;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [&key](NodeId a, NodeId b) { return key(a) < key(b); });
    return sorted;
}

// Connector labels
constexpr Point DEFAULT_LABEL_OFFSET{0.0f, -10.0f};
constexpr float LABEL_CHAR_WIDTH = 7.0f;
constexpr float LABEL_MIN_WIDTH = 30.0f;
constexpr float LABEL_LINE_HEIGHT = 16.0f;

constexpr Point LABEL_CANDIDATES[] = {
    {0.0f, -20.0f},    // Above
    {0.0f, 20.0f},     // Below
    {20.0f, 0.0f},     // Right
    {-20.0f, 0.0f},    // Left
    {15.0f, -15.0f},
    {-15.0f, -15.0f},
    {15.0f, 15.0f},
    {-15.0f, 15.0f},
};

Size estimateLabelSize(const std::string& label) {
    const auto lines = LabelMetrics::visibleLines(label);
    size_t longest = 0;
    for (const auto& line : lines) {
        longest = std::max(longest, LabelMetrics::characterCount(line));
    }
    const size_t lineCount = std::max<size_t>(1, lines.size());
    return {std::max(LABEL_MIN_WIDTH, static_cast<float>(longest) * LABEL_CHAR_WIDTH),
            static_cast<float>(lineCount) * LABEL_LINE_HEIGHT};
}

std::vector<float> keysOf(const std::vector<NodeId>& ids, const std::function<float(NodeId)>& key) {
    std::vector<float> keys;
    keys.reserve(ids.size());
    for (NodeId id : ids) keys.push_back(key(id));
    return keys;
}

}  // namespace

std::vector<std::vector<NodeId>> DiagramPolish::groupByProximity(const std::vector<NodeId>& sortedIds,
                                                                 const std::vector<float>& sortedKeys,
                                                                 float threshold) {
    std::vector<std::vector<NodeId>> groups;
    float last = 0.0f;
    for (size_t i = 0; i < sortedIds.size(); ++i) {
        if (groups.empty() || std::abs(sortedKeys[i] - last) > threshold) {
            groups.emplace_back();
        }
        groups.back().push_back(sortedIds[i]);
        last = sortedKeys[i];
    }
    return groups;
}

int DiagramPolish::compact(Diagram& diagram, float margin) {
    const auto ids = diagram.topLevelNodes();
    if (ids.size() < 2) return 0;

    const float g = diagram.gridSize();
    auto top = [&diagram](NodeId id) { return diagram.getNode(id).geometry.y; };
    auto left = [&diagram](NodeId id) { return diagram.getNode(id).geometry.x; };

    auto byY = sortedBy(ids, top);
    auto rows = groupByProximity(byY, keysOf(byY, top), GROUP_THRESHOLD);

    int moved = 0;

    // Vertical: stack rows margin apart starting at the first row
    float currentY = top(byY.front());
    for (const auto& row : rows) {
        float rowTop = std::numeric_limits<float>::max();
        float rowBottom = std::numeric_limits<float>::lowest();
        for (NodeId id : row) {
            const Rect& r = diagram.getNode(id).geometry;
            rowTop = std::min(rowTop, r.top());
            rowBottom = std::max(rowBottom, r.bottom());
        }

        float shift = currentY - rowTop;
        if (std::abs(shift) > COMPACT_MIN_SHIFT) {
            for (NodeId id : row) {
                Rect& r = diagram.getNode(id).geometry;
                r.y = grid::snapToGrid(r.y + shift, g);
                ++moved;
            }
        }
        currentY += (rowBottom - rowTop) + margin;
    }

    // Horizontal: close gaps inside each row
    for (const auto& row : rows) {
        if (row.size() < 2) continue;
        auto byX = sortedBy(row, left);
        float currentX = left(byX.front());
        for (NodeId id : byX) {
            Rect& r = diagram.getNode(id).geometry;
            if (std::abs(currentX - r.x) > COMPACT_MIN_SHIFT) {
                r.x = grid::snapToGrid(currentX, g);
                ++moved;
            }
            currentX = r.right() + margin;
        }
    }

    moved += alignRankBaselines(diagram, GROUP_THRESHOLD);
    moved += alignColumnCenters(diagram, GROUP_THRESHOLD);
    return moved;
}

int DiagramPolish::alignRankBaselines(Diagram& diagram, float threshold) {
    const auto ids = diagram.topLevelNodes();
    if (ids.size() < 2) return 0;

    auto centerY = [&diagram](NodeId id) { return diagram.getNode(id).geometry.centerY(); };
    auto sorted = sortedBy(ids, centerY);
    auto rows = groupByProximity(sorted, keysOf(sorted, centerY), threshold);

    int adjusted = 0;
    for (const auto& row : rows) {
        if (row.size() < 2) continue;
        float sum = 0.0f;
        for (NodeId id : row) sum += centerY(id);
        const float avg = sum / static_cast<float>(row.size());

        for (NodeId id : row) {
            Rect& r = diagram.getNode(id).geometry;
            float target = grid::snapToGrid(avg - r.height / 2, diagram.gridSize());
            if (std::abs(r.y - target) > 1.0f) {
                r.y = target;
                ++adjusted;
            }
        }
    }
    return adjusted;
}

int DiagramPolish::alignColumnCenters(Diagram& diagram, float threshold) {
    const auto ids = diagram.topLevelNodes();
    if (ids.size() < 2) return 0;

    auto centerX = [&diagram](NodeId id) { return diagram.getNode(id).geometry.centerX(); };
    auto sorted = sortedBy(ids, centerX);
    auto cols = groupByProximity(sorted, keysOf(sorted, centerX), threshold);

    int adjusted = 0;
    for (const auto& col : cols) {
        if (col.size() < 2) continue;
        float sum = 0.0f;
        for (NodeId id : col) sum += centerX(id);
        const float avg = sum / static_cast<float>(col.size());

        for (NodeId id : col) {
            Rect& r = diagram.getNode(id).geometry;
            float target = grid::snapToGrid(avg - r.width / 2, diagram.gridSize());
            if (std::abs(r.x - target) > 1.0f) {
                r.x = target;
                ++adjusted;
            }
        }
    }
    return adjusted;
}

int DiagramPolish::equalizeConnectedSizes(Diagram& diagram, Direction direction, float threshold) {
    const auto ids = diagram.topLevelNodes();
    if (ids.size() < 2) return 0;

    const bool rows = isVertical(direction);
    std::function<float(NodeId)> key = [&diagram, rows](NodeId id) {
        const Rect& r = diagram.getNode(id).geometry;
        return rows ? r.centerY() : r.centerX();
    };
    auto sorted = sortedBy(ids, key);
    auto groups = groupByProximity(sorted, keysOf(sorted, key), threshold);

    int adjusted = 0;
    for (const auto& group : groups) {
        if (group.size() < 2) continue;
        float largest = 0.0f;
        for (NodeId id : group) {
            const Rect& r = diagram.getNode(id).geometry;
            largest = std::max(largest, rows ? r.height : r.width);
        }
        for (NodeId id : group) {
            Rect& r = diagram.getNode(id).geometry;
            float& extent = rows ? r.height : r.width;
            if (extent < largest) {
                extent = largest;
                ++adjusted;
            }
        }
    }
    return adjusted;
}

int DiagramPolish::translateContent(Diagram& diagram, float dx, float dy) {
    const float g = diagram.gridSize();
    int moved = 0;
    for (NodeId id : diagram.topLevelNodes()) {
        Rect& r = diagram.getNode(id).geometry;
        r.x = grid::snapToGrid(r.x + dx, g);
        r.y = grid::snapToGrid(r.y + dy, g);
        ++moved;
    }
    for (EdgeId id : diagram.connectors()) {
        for (auto& p : diagram.waypoints(id)) {
            p = grid::snapToGrid(Point{p.x + dx, p.y + dy}, g);
        }
    }
    return moved;
}

int DiagramPolish::centerOnPage(Diagram& diagram, float margin) {
    const auto ids = diagram.topLevelNodes();
    if (ids.empty()) return 0;

    Rect content = diagram.getNode(ids.front()).geometry;
    for (NodeId id : ids) {
        content = content.united(diagram.getNode(id).geometry);
    }

    const PageSettings& page = diagram.page();
    float targetX = margin;
    float targetY = margin;
    if (page.width > 0 && page.height > 0) {
        targetX = std::max(margin, (page.width - content.width) / 2);
        targetY = std::max(margin, (page.height - content.height) / 2);
    }

    float shiftX = targetX - content.x;
    float shiftY = targetY - content.y;
    if (std::abs(shiftX) < 5.0f && std::abs(shiftY) < 5.0f) {
        return 0;
    }
    return translateContent(diagram, shiftX, shiftY);
}

int DiagramPolish::ensurePageMargins(Diagram& diagram, float margin) {
    const auto ids = diagram.topLevelNodes();
    if (ids.empty()) return 0;

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    for (NodeId id : ids) {
        const Rect& r = diagram.getNode(id).geometry;
        minX = std::min(minX, r.x);
        minY = std::min(minY, r.y);
    }

    float shiftX = std::max(0.0f, margin - minX);
    float shiftY = std::max(0.0f, margin - minY);
    if (shiftX < 1.0f && shiftY < 1.0f) {
        return 0;
    }
    return translateContent(diagram, shiftX, shiftY);
}

int DiagramPolish::positionEdgeLabels(Diagram& diagram, float margin) {
    const auto bounds = diagram.allAbsoluteBounds();
    int moved = 0;

    for (EdgeId id : diagram.connectors()) {
        ConnectorData& c = diagram.getConnector(id);
        if (c.label.empty()) continue;

        auto src = bounds.find(c.source);
        auto tgt = bounds.find(c.target);
        if (src == bounds.end() || tgt == bounds.end()) continue;

        // Containers of either endpoint hold the whole connector
        std::vector<Rect> shapes;
        for (const auto& [nodeId, box] : bounds) {
            if (diagram.isAncestorOf(nodeId, c.source) || diagram.isAncestorOf(nodeId, c.target)) {
                continue;
            }
            shapes.push_back(box);
        }

        const Point sc = src->second.center();
        const Point tc = tgt->second.center();
        const Point mid{(sc.x + tc.x) / 2, (sc.y + tc.y) / 2};
        const Size size = estimateLabelSize(c.label);

        auto collisions = [&](const Point& offset) {
            const Rect box{mid.x + offset.x - size.width / 2, mid.y + offset.y - size.height / 2,
                           size.width, size.height};
            return static_cast<int>(std::count_if(shapes.begin(), shapes.end(),
                [&](const Rect& shape) { return box.intersects(shape, margin); }));
        };

        const Point current = c.labelOffset.value_or(DEFAULT_LABEL_OFFSET);
        int fewest = collisions(current);
        if (fewest == 0) continue;

        Point best = current;
        for (const Point& offset : LABEL_CANDIDATES) {
            int n = collisions(offset);
            if (n < fewest) {
                fewest = n;
                best = offset;
            }
            if (n == 0) break;
        }

        if (best != current) {
            c.labelOffset = best;
            ++moved;
        } else {
            LOG_DEBUG("label of connector {} still touches {} shapes", id, fewest);
        }
    }
    return moved;
}

PolishReport DiagramPolish::polish(Diagram& diagram, Direction direction) {
    PolishReport report;

    LayoutOptions layoutOptions;
    layoutOptions.setDirection(direction).setGridSize(diagram.gridSize()).setRouteEdges(false);
    SugiyamaLayout layout(layoutOptions);
    report.relayout = static_cast<int>(layout.relayout(diagram).size());

    report.overlapsResolved = OverlapResolver::resolveOverlaps(diagram, 20.0f);
    report.compacted = compact(diagram, 40.0f);
    report.alignedRows = alignRankBaselines(diagram);
    report.alignedColumns = alignColumnCenters(diagram);
    report.equalized = equalizeConnectedSizes(diagram, direction);

    EdgeRouter router;
    report.routed = router.routeAll(diagram, 15.0f);

    EdgePathOptimizer optimizer(OptimizerOptions{}.setMargin(15.0f));
    report.optimized = optimizer.optimize(diagram);
    report.labelsMoved = positionEdgeLabels(diagram, 8.0f);

    report.centered = centerOnPage(diagram, 50.0f);
    report.marginShifted = ensurePageMargins(diagram, 40.0f);

    LOG_INFO("polish: relayout {}, overlaps {}, compact {}, aligned {}/{}, equalized {}, "
             "routed {}, optimized {}, labels {}, centered {}, margins {}",
             report.relayout, report.overlapsResolved, report.compacted, report.alignedRows,
             report.alignedColumns, report.equalized, report.routed, report.optimized,
             report.labelsMoved, report.centered, report.marginShifted);
    return report;
}

}  // namespace orthograph
