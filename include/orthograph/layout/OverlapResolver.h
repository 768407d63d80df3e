#pragma once

#include "../core/Diagram.h"
#include "../core/Types.h"

#include <vector>

namespace orthograph {

/// Outcome of one resolve() run
struct OverlapStats {
    int iterations = 0;       ///< Full pair scans performed
    bool converged = false;   ///< A scan found nothing left to separate
};

/// Two diagram nodes whose padded boxes intersect (first < second)
struct OverlapPair {
    NodeId first = INVALID_NODE;
    NodeId second = INVALID_NODE;

    bool operator==(const OverlapPair& o) const { return first == o.first && second == o.second; }
};

/// Iterative push-apart overlap removal.
///
/// Every scan visits all unordered pairs; an intersecting pair is pushed
/// apart along the axis of smaller overlap (ties go to x), each box moving
/// half the overlap plus one unit away from the other's center. Positions
/// are grid-snapped at the end. If snapping re-introduces contact, the
/// remaining iteration budget continues with whole-grid pushes.
///
/// Termination is bounded by maxIterations; stats.converged is false when
/// the cap was hit with overlap left.
class OverlapResolver {
public:
    /// Separate boxes in place
    /// @param boxes Boxes to move (sizes are never changed)
    /// @param padding Required gap between any two boxes
    /// @param gridSize Snap unit (0 = default grid)
    /// @param maxIterations Cap on full pair scans
    static OverlapStats resolve(std::vector<Rect>& boxes, float padding,
                                float gridSize, int maxIterations);

    /// True if any two boxes are closer than padding
    static bool hasOverlap(const std::vector<Rect>& boxes, float padding);

    /// Pairs of diagram nodes closer than margin, container/descendant pairs excluded
    static std::vector<OverlapPair> findOverlaps(const Diagram& diagram, float margin = 5.0f);

    /// Separate overlapping siblings of every container (top level included)
    /// @return Number of nodes that moved
    static int resolveOverlaps(Diagram& diagram, float margin = 20.0f, int maxIterations = 50);

private:
    /// One scan over all pairs. quantum > 0 rounds pushes up to its multiples.
    static bool separationPass(std::vector<Rect>& boxes, float padding, float quantum);
};

}  // namespace orthograph
