#pragma once

#include "orthograph/core/Types.h"

#include <optional>
#include <vector>

namespace orthograph {
namespace algorithms {

/// Sparse orthogonal search grid for one connection.
///
/// Candidate lines are the source/target centers plus the margin-expanded
/// edges of every obstacle and of source and target. Expanded left/top edges
/// snap down and right/bottom edges snap up, so every line lies on or outside
/// the clearance box it came from.
///
/// A grid point is blocked when it lies strictly inside an expanded obstacle;
/// a move between neighbors is blocked when it crosses the interior of one.
class VisibilityGrid {
public:
    VisibilityGrid(const Rect& source, const Rect& target,
                   const std::vector<Rect>& obstacles, float margin, float gridSize);

    int columns() const { return static_cast<int>(xs_.size()); }
    int rows() const { return static_cast<int>(ys_.size()); }

    float xAt(int col) const { return xs_[static_cast<size_t>(col)]; }
    float yAt(int row) const { return ys_[static_cast<size_t>(row)]; }
    Point pointAt(const GridPoint& p) const { return {xAt(p.x), yAt(p.y)}; }

    bool contains(const GridPoint& p) const {
        return p.x >= 0 && p.y >= 0 && p.x < columns() && p.y < rows();
    }

    bool isBlocked(const GridPoint& p) const;
    bool isMoveBlocked(const GridPoint& from, const GridPoint& to) const;

    /// Closest unblocked grid point by Manhattan distance.
    /// Ties keep the first found scanning columns, then rows.
    std::optional<GridPoint> nearestFree(const Point& p) const;

    const std::vector<Rect>& clearanceBoxes() const { return expanded_; }

private:
    std::vector<float> xs_;
    std::vector<float> ys_;
    std::vector<Rect> expanded_;
    std::vector<bool> blocked_;  // row-major, rows() * columns()

    size_t cellIndex(const GridPoint& p) const {
        return static_cast<size_t>(p.y) * xs_.size() + static_cast<size_t>(p.x);
    }
};

}  // namespace algorithms
}  // namespace orthograph
