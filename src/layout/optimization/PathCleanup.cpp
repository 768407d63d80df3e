#include "PathCleanup.h"
#include "orthograph/core/GeometryUtils.h"

#include <cmath>

namespace orthograph {

bool PathCleanup::isPointDuplicate(const Point& a, const Point& b) {
    return std::abs(a.x - b.x) < EPSILON && std::abs(a.y - b.y) < EPSILON;
}

std::vector<Point> PathCleanup::removeCollinear(const std::vector<Point>& path) {
    if (path.size() <= 2) {
        return path;
    }

    std::vector<Point> result;
    result.reserve(path.size());
    result.push_back(path.front());
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        const Point& prev = path[i - 1];
        const Point& cur = path[i];
        const Point& next = path[i + 1];
        bool sameX = std::abs(prev.x - cur.x) < AXIS_TOLERANCE && std::abs(cur.x - next.x) < AXIS_TOLERANCE;
        bool sameY = std::abs(prev.y - cur.y) < AXIS_TOLERANCE && std::abs(cur.y - next.y) < AXIS_TOLERANCE;
        if (!sameX && !sameY) {
            result.push_back(cur);
        }
    }
    result.push_back(path.back());
    return result;
}

std::vector<Point> PathCleanup::straighten(const std::vector<Point>& path, float threshold) {
    if (path.size() <= 2) {
        return path;
    }

    std::vector<Point> result;
    result.reserve(path.size());
    result.push_back(path.front());
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        const Point& prev = result.back();
        Point cur = path[i];
        float dx = std::abs(cur.x - prev.x);
        float dy = std::abs(cur.y - prev.y);
        if (dx < threshold && dy >= threshold) {
            cur.x = prev.x;  // nearly vertical
        } else if (dy < threshold && dx >= threshold) {
            cur.y = prev.y;  // nearly horizontal
        }
        result.push_back(cur);
    }
    result.push_back(path.back());
    return result;
}

std::vector<Point> PathCleanup::shortenDetours(const std::vector<Point>& path,
                                               const std::vector<Rect>& obstacles,
                                               float margin) {
    if (path.size() <= 3) {
        return path;
    }

    std::vector<Point> result = path;
    bool changed = true;
    while (changed) {
        changed = false;
        size_t i = 1;
        while (i + 1 < result.size()) {
            if (!geometry::anyObstacleOnSegment(result[i - 1], result[i + 1], obstacles, margin)) {
                result.erase(result.begin() + static_cast<std::ptrdiff_t>(i));
                changed = true;
            } else {
                ++i;
            }
        }
    }
    return result;
}

void PathCleanup::removeDuplicates(std::vector<Point>& points) {
    if (points.size() < 2) return;

    std::vector<Point> cleaned;
    cleaned.reserve(points.size());
    for (const auto& p : points) {
        if (cleaned.empty() || !isPointDuplicate(cleaned.back(), p)) {
            cleaned.push_back(p);
        }
    }
    points = std::move(cleaned);
}

}  // namespace orthograph
