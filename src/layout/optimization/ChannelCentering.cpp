#include "ChannelCentering.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace orthograph {

bool ChannelCentering::findChannel(float at, float lo, float hi, bool vertical,
                                   const std::vector<Rect>& obstacles, float margin,
                                   float& lower, float& upper) {
    lower = -std::numeric_limits<float>::infinity();
    upper = std::numeric_limits<float>::infinity();

    for (const auto& obs : obstacles) {
        // Obstacle must overlap the segment span on the other axis
        float spanLo = vertical ? obs.top() : obs.left();
        float spanHi = vertical ? obs.bottom() : obs.right();
        if (spanHi + margin < lo || spanLo - margin > hi) continue;

        float nearSide = vertical ? obs.right() : obs.bottom();
        float farSide = vertical ? obs.left() : obs.top();
        if (nearSide + margin <= at) {
            lower = std::max(lower, nearSide + margin);
        } else if (farSide - margin >= at) {
            upper = std::min(upper, farSide - margin);
        }
    }
    return std::isfinite(lower) && std::isfinite(upper);
}

std::vector<Point> ChannelCentering::center(const std::vector<Point>& path,
                                            const std::vector<Rect>& obstacles,
                                            float margin) {
    std::vector<Point> result = path;
    if (result.size() < 4) {
        return result;
    }

    for (size_t i = 1; i + 2 < result.size(); ++i) {
        Point& a = result[i];
        Point& b = result[i + 1];

        bool vertical = std::abs(a.x - b.x) < 1.0f;
        bool horizontal = !vertical && std::abs(a.y - b.y) < 1.0f;
        if (!vertical && !horizontal) continue;

        float at = vertical ? a.x : a.y;
        float lo = vertical ? std::min(a.y, b.y) : std::min(a.x, b.x);
        float hi = vertical ? std::max(a.y, b.y) : std::max(a.x, b.x);

        float lower = 0.0f;
        float upper = 0.0f;
        if (!findChannel(at, lo, hi, vertical, obstacles, margin, lower, upper)) continue;

        float width = upper - lower;
        float mid = (lower + upper) / 2.0f;
        if (width < 2 * margin || std::abs(mid - at) >= width * MAX_SHIFT_RATIO) continue;

        if (vertical) {
            a.x = mid;
            b.x = mid;
        } else {
            a.y = mid;
            b.y = mid;
        }
    }
    return result;
}

}  // namespace orthograph
