#pragma once

#include "orthograph/core/Types.h"

#include <vector>

namespace orthograph {

/// Moves axis-aligned segments to the middle of the free channel between
/// the nearest obstacles on either side.
///
/// Only segments between two interior waypoints are moved, so the first and
/// last segment stay attached to the source and target centers. A segment is
/// recentered when the channel is at least 2 * margin wide and the shift
/// stays under 40% of the channel width.
class ChannelCentering {
public:
    static constexpr float MAX_SHIFT_RATIO = 0.4f;

    /// @param path Full path (source center, waypoints..., target center)
    /// @param obstacles Obstacle boxes
    /// @param margin Clearance added to every obstacle side
    /// @return Path with recentered segments
    static std::vector<Point> center(const std::vector<Point>& path,
                                     const std::vector<Rect>& obstacles,
                                     float margin);

    /// Free channel around coordinate `at` for a segment spanning [lo, hi].
    /// @param vertical True for a vertical segment (channel along x)
    /// @return false when either side has no bounding obstacle
    static bool findChannel(float at, float lo, float hi, bool vertical,
                            const std::vector<Rect>& obstacles, float margin,
                            float& lower, float& upper);
};

}  // namespace orthograph
