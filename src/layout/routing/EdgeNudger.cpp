#include "EdgeNudger.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"

#include <algorithm>
#include <cmath>

namespace orthograph {

EdgeNudger::EdgeNudger() = default;

EdgeNudger::EdgeNudger(const Config& config) : config_(config) {}

std::vector<EdgeNudger::Segment> EdgeNudger::extractSegments(
    const std::vector<ConnectorPath>& paths) {

    std::vector<Segment> segments;
    for (size_t p = 0; p < paths.size(); ++p) {
        const auto& pts = paths[p].points;
        if (pts.size() < 4) continue;

        for (size_t i = 1; i + 2 < pts.size(); ++i) {
            const Point& a = pts[i];
            const Point& b = pts[i + 1];

            Segment seg;
            seg.edgeId = paths[p].edgeId;
            seg.pathIndex = p;
            seg.segmentIndex = i;
            if (std::abs(a.x - b.x) < COORDINATE_TOLERANCE) {
                seg.isVertical = true;
                seg.coordinate = a.x;
                seg.low = std::min(a.y, b.y);
                seg.high = std::max(a.y, b.y);
            } else if (std::abs(a.y - b.y) < COORDINATE_TOLERANCE) {
                seg.isVertical = false;
                seg.coordinate = a.y;
                seg.low = std::min(a.x, b.x);
                seg.high = std::max(a.x, b.x);
            } else {
                continue;  // diagonal
            }
            segments.push_back(seg);
        }
    }
    return segments;
}

bool EdgeNudger::rangesOverlap(const Segment& a, const Segment& b) {
    return a.low <= b.high && b.low <= a.high;
}

std::vector<EdgeNudger::OverlapGroup> EdgeNudger::detectOverlaps(
    const std::vector<ConnectorPath>& paths) const {

    std::vector<OverlapGroup> groups;
    const auto segments = extractSegments(paths);
    const float reach = 2.0f * config_.spacing;

    std::vector<bool> processed(segments.size(), false);
    for (size_t i = 0; i < segments.size(); ++i) {
        if (processed[i]) continue;
        const Segment& seed = segments[i];

        OverlapGroup group;
        group.isVertical = seed.isVertical;
        group.segments.push_back(seed);
        std::vector<size_t> members{i};

        for (size_t j = i + 1; j < segments.size(); ++j) {
            if (processed[j]) continue;
            const Segment& other = segments[j];
            if (other.isVertical != seed.isVertical) continue;
            if (other.edgeId == seed.edgeId) continue;
            if (std::abs(other.coordinate - seed.coordinate) > reach) continue;
            if (!rangesOverlap(seed, other)) continue;
            group.segments.push_back(other);
            members.push_back(j);
        }

        if (group.segments.size() < 2) continue;

        for (size_t m : members) processed[m] = true;

        std::stable_sort(group.segments.begin(), group.segments.end(),
                         [](const Segment& a, const Segment& b) { return a.coordinate < b.coordinate; });

        float sum = 0.0f;
        for (const auto& s : group.segments) sum += s.coordinate;
        group.coordinate = sum / static_cast<float>(group.segments.size());
        groups.push_back(std::move(group));
    }
    return groups;
}

EdgeNudger::Result EdgeNudger::apply(std::vector<ConnectorPath>& paths) const {
    Result result;
    if (!config_.enabled || config_.spacing <= 0.0f) {
        return result;
    }

    result.overlapGroups = detectOverlaps(paths);

    for (const auto& group : result.overlapGroups) {
        const size_t n = group.segments.size();
        const float start = group.coordinate - static_cast<float>(n - 1) * config_.spacing / 2.0f;

        for (size_t k = 0; k < n; ++k) {
            const Segment& seg = group.segments[k];
            float target = grid::snapToGrid(start + static_cast<float>(k) * config_.spacing,
                                            config_.gridSize);
            if (std::abs(target - seg.coordinate) < 1.0f) continue;

            auto& pts = paths[seg.pathIndex].points;
            if (group.isVertical) {
                pts[seg.segmentIndex].x = target;
                pts[seg.segmentIndex + 1].x = target;
            } else {
                pts[seg.segmentIndex].y = target;
                pts[seg.segmentIndex + 1].y = target;
            }
            ++result.movedSegments;
        }
    }

    if (result.movedSegments > 0) {
        LOG_DEBUG("separated {} segments in {} corridors",
                  result.movedSegments, result.overlapGroups.size());
    }
    return result;
}

}  // namespace orthograph
