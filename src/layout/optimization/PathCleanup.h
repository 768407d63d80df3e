#pragma once

#include "orthograph/core/Types.h"

#include <vector>

namespace orthograph {

/// Per-path cleanup passes. Each takes a full path
/// (source center, waypoints..., target center) and never moves the two
/// endpoints.
class PathCleanup {
public:
    /// Coordinate difference under which two points share an axis
    static constexpr float AXIS_TOLERANCE = 1.0f;

    /// Points closer than this are duplicates
    static constexpr float EPSILON = 0.1f;

    static bool isPointDuplicate(const Point& a, const Point& b);

    /// Drop every interior point that shares x (or y) with both of its
    /// original neighbors. Single pass, neighbors taken from the input.
    static std::vector<Point> removeCollinear(const std::vector<Point>& path);

    /// Align a point with the previously emitted one when it is within
    /// threshold on one axis and at least threshold away on the other
    static std::vector<Point> straighten(const std::vector<Point>& path, float threshold);

    /// Repeatedly drop interior points whose neighbors can be joined by a
    /// segment that clears every margin-expanded obstacle. Paths with at most
    /// one waypoint are returned unchanged.
    static std::vector<Point> shortenDetours(const std::vector<Point>& path,
                                             const std::vector<Rect>& obstacles,
                                             float margin);

    /// Remove consecutive duplicates in place
    static void removeDuplicates(std::vector<Point>& points);
};

}  // namespace orthograph
