#pragma once

#include "../../core/Types.h"
#include "../config/LayoutOptions.h"

#include <vector>

namespace orthograph {

/// How a route was obtained
enum class RouteKind {
    Direct,     ///< Straight line was already clear, no waypoints
    Searched,   ///< A path was found on the visibility grid
    Fallback    ///< Search failed, wide detour around all obstacles
};

/// Result of routing one connection
struct RouteResult {
    std::vector<Point> waypoints;  ///< Intermediate points only, grid-snapped
    RouteKind kind = RouteKind::Direct;
    int expansions = 0;            ///< States popped by the search
};

/// Abstract interface for orthogonal routing between two boxes
///
/// Implementations compute a route from the center of source to the center
/// of target that stays clear of every obstacle by options.margin.
class IPathFinder {
public:
    virtual ~IPathFinder() = default;

    /// Route one connection
    /// @param source Source box (not an obstacle)
    /// @param target Target box (not an obstacle)
    /// @param obstacles Boxes the route must avoid
    /// @param options Margin, grid size, bend penalty and expansion cap
    /// @return Waypoints between the two centers
    virtual RouteResult findRoute(
        const Rect& source,
        const Rect& target,
        const std::vector<Rect>& obstacles,
        const RouterOptions& options) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace orthograph
