#pragma once

#include "orthograph/core/Types.h"

#include <vector>

namespace orthograph {

/// Separation of connector segments that share a corridor
///
/// Axis-aligned segments of different connectors that run in the same
/// direction, lie within 2 * spacing of each other and overlap along their
/// length are clustered and spread evenly around the cluster's average
/// coordinate.
///
/// Only segments between two interior waypoints are considered, so the
/// first and last segment of a path keep touching the endpoint centers.
class EdgeNudger {
public:
    /// Coordinate difference under which a segment counts as axis-aligned
    static constexpr float COORDINATE_TOLERANCE = 1.0f;

    /// Configuration for nudging
    struct Config {
        float spacing = 10.0f;   ///< Distance between separated segments
        float gridSize = 10.0f;  ///< Separated coordinates are snapped to this grid
        bool enabled = true;

        Config() = default;
    };

    /// Full path of one connector (source center, waypoints..., target center)
    struct ConnectorPath {
        EdgeId edgeId = INVALID_EDGE;
        std::vector<Point> points;
    };

    /// Segment representation for corridor detection
    struct Segment {
        EdgeId edgeId = INVALID_EDGE;
        size_t pathIndex = 0;     ///< Index into the paths vector
        size_t segmentIndex = 0;  ///< Segment runs from points[i] to points[i+1]
        bool isVertical = false;
        float coordinate = 0.0f;  ///< x for vertical, y for horizontal
        float low = 0.0f;         ///< Extent along the variable axis
        float high = 0.0f;
    };

    /// Segments sharing one corridor
    struct OverlapGroup {
        bool isVertical = false;
        float coordinate = 0.0f;  ///< Average fixed coordinate
        std::vector<Segment> segments;
    };

    struct Result {
        std::vector<OverlapGroup> overlapGroups;
        int movedSegments = 0;
    };

    EdgeNudger();
    explicit EdgeNudger(const Config& config);

    /// Detect corridor clusters without modifying the paths
    std::vector<OverlapGroup> detectOverlaps(const std::vector<ConnectorPath>& paths) const;

    /// Spread every cluster in place
    Result apply(std::vector<ConnectorPath>& paths) const;

    const Config& config() const { return config_; }
    void setConfig(const Config& config) { config_ = config; }

    /// Interior axis-aligned segments of all paths
    static std::vector<Segment> extractSegments(const std::vector<ConnectorPath>& paths);

private:
    static bool rangesOverlap(const Segment& a, const Segment& b);

    Config config_;
};

}  // namespace orthograph
