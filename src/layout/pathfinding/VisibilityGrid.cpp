#include "VisibilityGrid.h"
#include "orthograph/core/GeometryUtils.h"

#include <algorithm>
#include <limits>

namespace orthograph {
namespace algorithms {

namespace {

void sortUnique(std::vector<float>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

}  // namespace

VisibilityGrid::VisibilityGrid(const Rect& source, const Rect& target,
                               const std::vector<Rect>& obstacles, float margin, float gridSize) {
    const Point sc = source.center();
    const Point tc = target.center();
    xs_ = {sc.x, tc.x};
    ys_ = {sc.y, tc.y};

    auto addBoxLines = [&](const Rect& box) {
        xs_.push_back(grid::snapDown(box.left() - margin, gridSize));
        xs_.push_back(grid::snapUp(box.right() + margin, gridSize));
        ys_.push_back(grid::snapDown(box.top() - margin, gridSize));
        ys_.push_back(grid::snapUp(box.bottom() + margin, gridSize));
    };

    expanded_.reserve(obstacles.size());
    for (const auto& obs : obstacles) {
        addBoxLines(obs);
        expanded_.push_back(obs.expanded(margin));
    }
    addBoxLines(source);
    addBoxLines(target);

    sortUnique(xs_);
    sortUnique(ys_);

    blocked_.assign(xs_.size() * ys_.size(), false);
    for (int row = 0; row < rows(); ++row) {
        for (int col = 0; col < columns(); ++col) {
            Point p{xAt(col), yAt(row)};
            bool inside = std::any_of(expanded_.begin(), expanded_.end(),
                                      [&](const Rect& box) { return geometry::strictlyInside(p, box); });
            blocked_[cellIndex({col, row})] = inside;
        }
    }
}

bool VisibilityGrid::isBlocked(const GridPoint& p) const {
    return blocked_[cellIndex(p)];
}

bool VisibilityGrid::isMoveBlocked(const GridPoint& from, const GridPoint& to) const {
    Point a = pointAt(from);
    Point b = pointAt(to);
    return std::any_of(expanded_.begin(), expanded_.end(),
                       [&](const Rect& box) { return geometry::segmentCrossesInterior(a, b, box); });
}

std::optional<GridPoint> VisibilityGrid::nearestFree(const Point& p) const {
    std::optional<GridPoint> best;
    float bestDist = std::numeric_limits<float>::infinity();

    for (int col = 0; col < columns(); ++col) {
        for (int row = 0; row < rows(); ++row) {
            GridPoint g{col, row};
            if (isBlocked(g)) continue;
            float d = pointAt(g).manhattanTo(p);
            if (d < bestDist) {
                bestDist = d;
                best = g;
            }
        }
    }
    return best;
}

}  // namespace algorithms
}  // namespace orthograph
