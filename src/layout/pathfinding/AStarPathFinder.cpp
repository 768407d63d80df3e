#include "AStarPathFinder.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <queue>
#include <unordered_map>

namespace orthograph {
namespace algorithms {

namespace {

struct SearchKey {
    GridPoint pos;
    MoveDirection dir;

    bool operator==(const SearchKey& other) const {
        return pos == other.pos && dir == other.dir;
    }
};

struct SearchKeyHash {
    std::size_t operator()(const SearchKey& k) const {
        return std::hash<int>()(k.pos.x) ^
               (std::hash<int>()(k.pos.y) << 16) ^
               (std::hash<int>()(static_cast<int>(k.dir)) << 28);
    }
};

struct Step {
    GridPoint delta;
    MoveDirection dir;
};

constexpr Step STEPS[4] = {
    {{1, 0}, MoveDirection::Right},
    {{-1, 0}, MoveDirection::Left},
    {{0, 1}, MoveDirection::Down},
    {{0, -1}, MoveDirection::Up},
};

}  // namespace

RouteResult AStarPathFinder::findRoute(
    const Rect& source,
    const Rect& target,
    const std::vector<Rect>& obstacles,
    const RouterOptions& options) const {

    RouteResult result;
    const Point sc = source.center();
    const Point tc = target.center();

    if (!geometry::anyObstacleOnSegment(sc, tc, obstacles, options.margin)) {
        result.kind = RouteKind::Direct;
        return result;
    }

    VisibilityGrid grid(source, target, obstacles, options.margin, options.gridSize);
    auto start = grid.nearestFree(sc);
    auto goal = grid.nearestFree(tc);

    if (start && goal) {
        result.kind = RouteKind::Searched;
        if (*start == *goal) {
            return result;
        }

        std::vector<GridPoint> cells = search(grid, *start, *goal, options, result.expansions);
        if (!cells.empty()) {
            std::vector<Point> path;
            path.reserve(cells.size());
            for (const auto& c : cells) {
                path.push_back(grid.pointAt(c));
            }

            for (const auto& p : simplifyPath(path)) {
                Point snapped = grid::snapWaypoint(p, options.gridSize, sc, tc);
                if (result.waypoints.empty() || result.waypoints.back() != snapped) {
                    result.waypoints.push_back(snapped);
                }
            }
            return result;
        }
    }

    LOG_DEBUG("no grid path after {} expansions, using detour around {} obstacles",
              result.expansions, obstacles.size());
    result.kind = RouteKind::Fallback;
    result.waypoints = fallbackRoute(source, target, obstacles, options.margin, options.gridSize);
    return result;
}

std::vector<GridPoint> AStarPathFinder::search(const VisibilityGrid& grid,
                                               const GridPoint& start,
                                               const GridPoint& goal,
                                               const RouterOptions& options,
                                               int& expansions) const {
    const Point goalPoint = grid.pointAt(goal);

    std::priority_queue<SearchNode, std::vector<SearchNode>, std::greater<SearchNode>> openSet;
    std::unordered_map<SearchKey, float, SearchKeyHash> bestCost;
    std::unordered_map<SearchKey, SearchKey, SearchKeyHash> cameFrom;
    uint64_t sequence = 0;

    SearchNode startNode;
    startNode.pos = start;
    startNode.f = grid.pointAt(start).manhattanTo(goalPoint);
    startNode.sequence = sequence++;
    openSet.push(startNode);
    bestCost[{start, MoveDirection::None}] = 0.0f;

    while (!openSet.empty()) {
        SearchNode current = openSet.top();
        openSet.pop();

        SearchKey currentKey{current.pos, current.lastDir};
        auto known = bestCost.find(currentKey);
        if (known != bestCost.end() && current.g > known->second) {
            continue;  // stale entry
        }

        if (expansions >= options.maxExpansions) {
            LOG_WARN("A* expansion cap of {} reached", options.maxExpansions);
            return {};
        }
        ++expansions;

        if (current.pos == goal) {
            std::vector<GridPoint> path;
            SearchKey key = currentKey;
            while (true) {
                path.push_back(key.pos);
                auto it = cameFrom.find(key);
                if (it == cameFrom.end()) break;
                key = it->second;
            }
            std::reverse(path.begin(), path.end());
            return path;
        }

        const Point here = grid.pointAt(current.pos);
        for (const auto& step : STEPS) {
            GridPoint next = current.pos + step.delta;
            if (!grid.contains(next) || grid.isBlocked(next)) continue;
            if (grid.isMoveBlocked(current.pos, next)) continue;

            const Point there = grid.pointAt(next);
            float cost = here.manhattanTo(there);
            if (current.lastDir != MoveDirection::None && current.lastDir != step.dir) {
                cost += options.bendPenalty;
            }

            float g = current.g + cost;
            SearchKey nextKey{next, step.dir};
            auto it = bestCost.find(nextKey);
            if (it != bestCost.end() && it->second <= g) continue;

            bestCost[nextKey] = g;
            cameFrom[nextKey] = currentKey;

            SearchNode node;
            node.pos = next;
            node.lastDir = step.dir;
            node.g = g;
            node.f = g + there.manhattanTo(goalPoint);
            node.sequence = sequence++;
            openSet.push(node);
        }
    }
    return {};
}

std::vector<Point> AStarPathFinder::simplifyPath(const std::vector<Point>& path) {
    if (path.size() <= 2) {
        return {};
    }

    constexpr float AXIS_TOLERANCE = 0.5f;
    std::vector<Point> turns;
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        const Point& prev = path[i - 1];
        const Point& cur = path[i];
        const Point& next = path[i + 1];
        float dx1 = cur.x - prev.x;
        float dy1 = cur.y - prev.y;
        float dx2 = next.x - cur.x;
        float dy2 = next.y - cur.y;
        bool turnsHere = (std::abs(dx1) > AXIS_TOLERANCE && std::abs(dy2) > AXIS_TOLERANCE) ||
                         (std::abs(dy1) > AXIS_TOLERANCE && std::abs(dx2) > AXIS_TOLERANCE);
        if (turnsHere) {
            turns.push_back(cur);
        }
    }
    return turns;
}

std::vector<Point> AStarPathFinder::fallbackRoute(
    const Rect& source,
    const Rect& target,
    const std::vector<Rect>& obstacles,
    float margin,
    float gridSize) {

    const Point sc = source.center();
    const Point tc = target.center();

    if (std::abs(tc.x - sc.x) > std::abs(tc.y - sc.y)) {
        float above = sc.y;
        float below = sc.y;
        if (!obstacles.empty()) {
            float top = obstacles.front().top();
            float bottom = obstacles.front().bottom();
            for (const auto& o : obstacles) {
                top = std::min(top, o.top());
                bottom = std::max(bottom, o.bottom());
            }
            above = top - 2 * margin;
            below = bottom + 2 * margin;
        }
        float mid = (sc.y + tc.y) / 2.0f;
        float y = std::abs(above - mid) < std::abs(below - mid) ? above : below;
        y = grid::snapToGrid(y, gridSize);
        return {{grid::snapToGrid(sc.x, gridSize), y}, {grid::snapToGrid(tc.x, gridSize), y}};
    }

    float left = sc.x;
    float right = sc.x;
    if (!obstacles.empty()) {
        float minX = obstacles.front().left();
        float maxX = obstacles.front().right();
        for (const auto& o : obstacles) {
            minX = std::min(minX, o.left());
            maxX = std::max(maxX, o.right());
        }
        left = minX - 2 * margin;
        right = maxX + 2 * margin;
    }
    float mid = (sc.x + tc.x) / 2.0f;
    float x = std::abs(left - mid) < std::abs(right - mid) ? left : right;
    x = grid::snapToGrid(x, gridSize);
    return {{x, grid::snapToGrid(sc.y, gridSize)}, {x, grid::snapToGrid(tc.y, gridSize)}};
}

}  // namespace algorithms
}  // namespace orthograph
