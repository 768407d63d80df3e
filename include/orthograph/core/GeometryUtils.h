#pragma once

#include "Types.h"

#include <cmath>
#include <vector>

namespace orthograph {

/// Segment and box queries shared by routing, optimization and overlap code
namespace geometry {

/// Liang-Barsky clip test: does segment p1-p2 touch rect (boundary inclusive)?
/// Works for arbitrary (including diagonal) segments.
bool lineIntersectsRect(const Point& p1, const Point& p2, const Rect& rect);

/// Inclusive hit test for an axis-aligned segment.
/// Segments that are not axis-aligned fall back to lineIntersectsRect.
/// @param axisTolerance Coordinate difference under which a segment counts as
///        vertical or horizontal
bool orthogonalSegmentHitsRect(const Point& p1, const Point& p2, const Rect& rect,
                               float axisTolerance = 0.5f);

/// True only when the segment passes through the open interior of rect.
/// Running along an edge or stopping at the boundary does not count.
bool segmentCrossesInterior(const Point& p1, const Point& p2, const Rect& rect);

/// Point strictly inside rect (boundary excluded)
inline bool strictlyInside(const Point& p, const Rect& rect) {
    return p.x > rect.left() && p.x < rect.right() &&
           p.y > rect.top() && p.y < rect.bottom();
}

/// Does segment p1-p2 touch any obstacle expanded by margin?
bool anyObstacleOnSegment(const Point& p1, const Point& p2,
                          const std::vector<Rect>& obstacles, float margin);

}  // namespace geometry

/// Shared layout constants
///
/// A grid size of 0 (or negative, or NaN) means "use DEFAULT_GRID_SIZE".
/// Resolve it with effectiveGridSize() before snapping.
namespace constants {

constexpr float EPSILON = 1e-6f;

constexpr float DEFAULT_GRID_SIZE = 10.0f;

inline float effectiveGridSize(float gridSize) noexcept {
    return (gridSize > 0.0f && std::isfinite(gridSize)) ? gridSize : DEFAULT_GRID_SIZE;
}

}  // namespace constants

/// Grid snapping. Every coordinate the engine writes goes through here.
namespace grid {

/// Nearest multiple of gridSize (halves round away from zero)
inline float snapToGrid(float value, float gridSize) noexcept {
    float g = constants::effectiveGridSize(gridSize);
    return std::round(value / g) * g;
}

/// Largest multiple of gridSize not greater than value (use for left/top bounds)
inline float snapDown(float value, float gridSize) noexcept {
    float g = constants::effectiveGridSize(gridSize);
    return std::floor(value / g) * g;
}

/// Smallest multiple of gridSize not less than value (use for right/bottom bounds)
inline float snapUp(float value, float gridSize) noexcept {
    float g = constants::effectiveGridSize(gridSize);
    return std::ceil(value / g) * g;
}

inline Point snapToGrid(const Point& p, float gridSize) noexcept {
    return {snapToGrid(p.x, gridSize), snapToGrid(p.y, gridSize)};
}

/// Snap a route waypoint. A coordinate equal to the from/to center stays
/// exact so the legs into the endpoints remain orthogonal.
inline Point snapWaypoint(const Point& p, float gridSize, const Point& from, const Point& to) noexcept {
    float x = (p.x == from.x || p.x == to.x) ? p.x : snapToGrid(p.x, gridSize);
    float y = (p.y == from.y || p.y == to.y) ? p.y : snapToGrid(p.y, gridSize);
    return {x, y};
}

inline bool isOnGrid(float value, float gridSize) noexcept {
    float g = constants::effectiveGridSize(gridSize);
    return std::abs(value - snapToGrid(value, g)) < 1e-3f;
}

}  // namespace grid

}  // namespace orthograph
