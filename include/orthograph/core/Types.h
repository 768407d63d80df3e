#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace orthograph {

using NodeId = uint32_t;
using EdgeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }

    float manhattanTo(const Point& o) const { return std::abs(x - o.x) + std::abs(y - o.y); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Integer cell index into a visibility grid (column, row)
struct GridPoint {
    int x = 0;
    int y = 0;

    constexpr GridPoint() = default;
    constexpr GridPoint(int x_, int y_) : x(x_), y(y_) {}

    constexpr GridPoint operator+(const GridPoint& o) const { return {x + o.x, y + o.y}; }

    constexpr bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const GridPoint& o) const { return !(*this == o); }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

/// Axis-aligned box, top-left origin. Width and height are never negative.
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }
    constexpr float centerX() const { return x + width / 2; }
    constexpr float centerY() const { return y + height / 2; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    /// True when the boxes, each grown by margin on every side, share area.
    /// Touching edges do not count as intersecting.
    constexpr bool intersects(const Rect& o, float margin = 0.0f) const {
        return !(right() + margin <= o.x || o.right() + margin <= x ||
                 bottom() + margin <= o.y || o.bottom() + margin <= y);
    }

    Rect united(const Rect& other) const {
        float minX = std::min(x, other.x);
        float minY = std::min(y, other.y);
        float maxX = std::max(right(), other.right());
        float maxY = std::max(bottom(), other.bottom());
        return {minX, minY, maxX - minX, maxY - minY};
    }

    Rect expanded(float padding) const {
        return {x - padding, y - padding, width + 2 * padding, height + 2 * padding};
    }

    Rect translated(float dx, float dy) const {
        return {x + dx, y + dy, width, height};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace orthograph
