#include "orthograph/layout/PortDistributor.h"
#include "orthograph/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace orthograph {

namespace {

using GroupKey = std::pair<NodeId, PortSide>;

bool runsAlongX(PortSide side) {
    return side == PortSide::Top || side == PortSide::Bottom;
}

/// Coordinate of other along the given side of this node
float sortKey(const std::unordered_map<NodeId, Rect>& bounds, NodeId other, PortSide side) {
    auto it = bounds.find(other);
    if (it == bounds.end()) return 0.0f;
    return runsAlongX(side) ? it->second.centerX() : it->second.centerY();
}

void orderGroup(std::vector<size_t>& indices, const std::vector<float>& keys) {
    std::stable_sort(indices.begin(), indices.end(),
                     [&keys](size_t a, size_t b) { return keys[a] < keys[b]; });
}

}  // namespace

PortAssignment PortDistributor::chooseBestPorts(const Rect& source, const Rect& target,
                                                PortPreference preference) {
    const float dx = target.centerX() - source.centerX();
    const float dy = target.centerY() - source.centerY();

    bool horizontal = preference == PortPreference::Horizontal;
    if (preference == PortPreference::Auto) {
        if (std::abs(dx) > std::abs(dy) * AUTO_DOMINANCE_RATIO) {
            horizontal = true;
        } else if (std::abs(dy) > std::abs(dx) * AUTO_DOMINANCE_RATIO) {
            horizontal = false;
        } else {
            horizontal = std::abs(dy) < std::abs(dx);
        }
    }

    if (horizontal) {
        return dx >= 0 ? PortAssignment{{1.0f, 0.5f}, {0.0f, 0.5f}}
                       : PortAssignment{{0.0f, 0.5f}, {1.0f, 0.5f}};
    }
    return dy >= 0 ? PortAssignment{{0.5f, 1.0f}, {0.5f, 0.0f}}
                   : PortAssignment{{0.5f, 0.0f}, {0.5f, 1.0f}};
}

std::pair<PortSide, PortSide> PortDistributor::determineSides(const Rect& source, const Rect& target) {
    const float dx = target.centerX() - source.centerX();
    const float dy = target.centerY() - source.centerY();

    if (std::abs(dx) > std::abs(dy) * SIDE_DOMINANCE_RATIO) {
        return dx >= 0 ? std::make_pair(PortSide::Right, PortSide::Left)
                       : std::make_pair(PortSide::Left, PortSide::Right);
    }
    return dy >= 0 ? std::make_pair(PortSide::Bottom, PortSide::Top)
                   : std::make_pair(PortSide::Top, PortSide::Bottom);
}

PortAnchor PortDistributor::sideCenter(PortSide side) {
    switch (side) {
        case PortSide::Top: return {0.5f, 0.0f};
        case PortSide::Bottom: return {0.5f, 1.0f};
        case PortSide::Left: return {0.0f, 0.5f};
        case PortSide::Right: return {1.0f, 0.5f};
    }
    return {};
}

PortAnchor PortDistributor::distributeOnSide(PortSide side, int count, int index) {
    if (count <= 1) {
        return sideCenter(side);
    }

    float t = CORNER_MARGIN + (1.0f - 2.0f * CORNER_MARGIN) * static_cast<float>(index) /
                                  static_cast<float>(count - 1);
    switch (side) {
        case PortSide::Top: return {t, 0.0f};
        case PortSide::Bottom: return {t, 1.0f};
        case PortSide::Left: return {0.0f, t};
        case PortSide::Right: return {1.0f, t};
    }
    return {};
}

std::vector<PortAssignment> PortDistributor::distributeForBatch(
    const std::vector<std::pair<NodeId, NodeId>>& connections,
    const std::unordered_map<NodeId, Rect>& bounds) {

    const size_t n = connections.size();
    std::vector<PortAssignment> result(n);
    if (n == 0) return result;

    std::vector<std::pair<PortSide, PortSide>> sides(n, {PortSide::Right, PortSide::Left});
    for (size_t i = 0; i < n; ++i) {
        auto src = bounds.find(connections[i].first);
        auto tgt = bounds.find(connections[i].second);
        if (src != bounds.end() && tgt != bounds.end()) {
            sides[i] = determineSides(src->second, tgt->second);
        }
    }

    std::map<GroupKey, std::vector<size_t>> exitGroups;
    std::map<GroupKey, std::vector<size_t>> entryGroups;
    std::vector<float> exitKeys(n);
    std::vector<float> entryKeys(n);
    for (size_t i = 0; i < n; ++i) {
        const auto [source, target] = connections[i];
        exitGroups[{source, sides[i].first}].push_back(i);
        entryGroups[{target, sides[i].second}].push_back(i);
        exitKeys[i] = sortKey(bounds, target, sides[i].first);
        entryKeys[i] = sortKey(bounds, source, sides[i].second);
    }

    for (auto& [key, indices] : exitGroups) orderGroup(indices, exitKeys);
    for (auto& [key, indices] : entryGroups) orderGroup(indices, entryKeys);

    for (const auto& [key, indices] : exitGroups) {
        const int count = static_cast<int>(indices.size());
        for (int k = 0; k < count; ++k) {
            result[indices[static_cast<size_t>(k)]].exit = distributeOnSide(key.second, count, k);
        }
    }
    for (const auto& [key, indices] : entryGroups) {
        const int count = static_cast<int>(indices.size());
        for (int k = 0; k < count; ++k) {
            result[indices[static_cast<size_t>(k)]].entry = distributeOnSide(key.second, count, k);
        }
    }
    return result;
}

int PortDistributor::applyToDiagram(Diagram& diagram, const std::vector<EdgeId>& connectors) {
    std::vector<EdgeId> ids;
    std::vector<std::pair<NodeId, NodeId>> connections;
    for (EdgeId id : connectors) {
        auto c = diagram.tryGetConnector(id);
        if (!c) continue;
        ids.push_back(id);
        connections.emplace_back(c->source, c->target);
    }

    auto assignments = distributeForBatch(connections, diagram.allAbsoluteBounds());
    for (size_t i = 0; i < ids.size(); ++i) {
        diagram.setPorts(ids[i], assignments[i].exit, assignments[i].entry);
    }

    LOG_DEBUG("assigned ports for {} connectors", ids.size());
    return static_cast<int>(ids.size());
}

}  // namespace orthograph
