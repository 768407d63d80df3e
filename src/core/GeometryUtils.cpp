#include "orthograph/core/GeometryUtils.h"

#include <algorithm>

namespace orthograph {
namespace geometry {

bool lineIntersectsRect(const Point& p1, const Point& p2, const Rect& rect) {
    const float dx = p2.x - p1.x;
    const float dy = p2.y - p1.y;

    // (p, q) pairs for the left, right, top and bottom clip edges
    const float p[4] = {-dx, dx, -dy, dy};
    const float q[4] = {p1.x - rect.left(), rect.right() - p1.x,
                        p1.y - rect.top(), rect.bottom() - p1.y};

    float t0 = 0.0f;
    float t1 = 1.0f;
    for (int i = 0; i < 4; ++i) {
        if (std::abs(p[i]) < 1e-9f) {
            if (q[i] < 0.0f) {
                return false;  // parallel and outside
            }
            continue;
        }
        float t = q[i] / p[i];
        if (p[i] < 0.0f) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
    }
    return t0 <= t1;
}

bool orthogonalSegmentHitsRect(const Point& p1, const Point& p2, const Rect& rect,
                               float axisTolerance) {
    if (std::abs(p1.x - p2.x) < axisTolerance) {
        float minY = std::min(p1.y, p2.y);
        float maxY = std::max(p1.y, p2.y);
        return rect.left() <= p1.x && p1.x <= rect.right() &&
               maxY >= rect.top() && minY <= rect.bottom();
    }
    if (std::abs(p1.y - p2.y) < axisTolerance) {
        float minX = std::min(p1.x, p2.x);
        float maxX = std::max(p1.x, p2.x);
        return rect.top() <= p1.y && p1.y <= rect.bottom() &&
               maxX >= rect.left() && minX <= rect.right();
    }
    return lineIntersectsRect(p1, p2, rect);
}

bool segmentCrossesInterior(const Point& p1, const Point& p2, const Rect& rect) {
    if (rect.width <= 0.0f || rect.height <= 0.0f) {
        return false;
    }

    float minX = std::min(p1.x, p2.x);
    float maxX = std::max(p1.x, p2.x);
    float minY = std::min(p1.y, p2.y);
    float maxY = std::max(p1.y, p2.y);

    if (std::abs(p1.x - p2.x) < constants::EPSILON) {
        return p1.x > rect.left() && p1.x < rect.right() &&
               maxY > rect.top() && minY < rect.bottom();
    }
    if (std::abs(p1.y - p2.y) < constants::EPSILON) {
        return p1.y > rect.top() && p1.y < rect.bottom() &&
               maxX > rect.left() && minX < rect.right();
    }

    // Diagonal: clip against a box shrunk by a hair so boundary grazes pass
    Rect inner{rect.x + constants::EPSILON, rect.y + constants::EPSILON,
               rect.width - 2 * constants::EPSILON, rect.height - 2 * constants::EPSILON};
    return lineIntersectsRect(p1, p2, inner);
}

bool anyObstacleOnSegment(const Point& p1, const Point& p2,
                          const std::vector<Rect>& obstacles, float margin) {
    return std::any_of(obstacles.begin(), obstacles.end(), [&](const Rect& obs) {
        return lineIntersectsRect(p1, p2, obs.expanded(margin));
    });
}

}  // namespace geometry
}  // namespace orthograph
