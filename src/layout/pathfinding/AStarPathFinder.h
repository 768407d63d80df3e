#pragma once

#include "orthograph/layout/api/IPathFinder.h"
#include "VisibilityGrid.h"

#include <cstdint>
#include <vector>

namespace orthograph {
namespace algorithms {

/// Direction of the last move into a search state
enum class MoveDirection {
    None,
    Up,
    Down,
    Left,
    Right
};

/// A* router over a VisibilityGrid.
///
/// Search states are (grid point, incoming direction). Move cost is the
/// segment length plus RouterOptions::bendPenalty when the direction
/// changes; the heuristic is Manhattan distance to the goal. The open set is
/// ordered by total cost, then by insertion order, so results are
/// reproducible. When the search fails or exceeds the expansion cap a wide
/// detour around the whole obstacle span is returned instead.
class AStarPathFinder : public IPathFinder {
public:
    AStarPathFinder() = default;

    const char* algorithmName() const override { return "A*"; }

    RouteResult findRoute(
        const Rect& source,
        const Rect& target,
        const std::vector<Rect>& obstacles,
        const RouterOptions& options) const override;

    /// Detour above/below (mostly horizontal connections) or left/right of
    /// every obstacle, whichever side is closer to the connection midpoint.
    static std::vector<Point> fallbackRoute(
        const Rect& source,
        const Rect& target,
        const std::vector<Rect>& obstacles,
        float margin,
        float gridSize);

    /// Keep only points where the path turns, then drop both endpoints
    static std::vector<Point> simplifyPath(const std::vector<Point>& path);

private:
    struct SearchNode {
        GridPoint pos;
        MoveDirection lastDir = MoveDirection::None;
        float g = 0.0f;
        float f = 0.0f;
        uint64_t sequence = 0;

        // Min-heap on (f, insertion order)
        bool operator>(const SearchNode& other) const {
            if (f != other.f) return f > other.f;
            return sequence > other.sequence;
        }
    };

    /// Grid path from start to goal, empty when none was found within the cap
    std::vector<GridPoint> search(const VisibilityGrid& grid,
                                  const GridPoint& start,
                                  const GridPoint& goal,
                                  const RouterOptions& options,
                                  int& expansions) const;
};

}  // namespace algorithms
}  // namespace orthograph
