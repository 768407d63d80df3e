#pragma once

#include "../core/Diagram.h"
#include "config/LayoutOptions.h"

#include <vector>

namespace orthograph {

/// Counters reported by DiagramPolish::polish()
struct PolishReport {
    int relayout = 0;
    int overlapsResolved = 0;
    int compacted = 0;
    int alignedRows = 0;
    int alignedColumns = 0;
    int equalized = 0;
    int routed = 0;
    int optimized = 0;
    int labelsMoved = 0;
    int centered = 0;
    int marginShifted = 0;
};

/// Whole-diagram cleanup passes. All of them work on top-level nodes and
/// return the number of nodes they adjusted. Positions stay on the
/// diagram grid.
class DiagramPolish {
public:
    /// Grouping threshold for rows/columns (center distance, pixels)
    static constexpr float GROUP_THRESHOLD = 20.0f;

    /// Close vertical gaps between rows and horizontal gaps inside each
    /// row down to margin, then align rows and columns
    static int compact(Diagram& diagram, float margin = 40.0f);

    /// Give nodes whose vertical centers are within threshold one center
    static int alignRankBaselines(Diagram& diagram, float threshold = GROUP_THRESHOLD);

    /// Give nodes whose horizontal centers are within threshold one center
    static int alignColumnCenters(Diagram& diagram, float threshold = GROUP_THRESHOLD);

    /// Rows get the tallest height (vertical directions), columns the widest
    /// width (horizontal directions). Nodes only grow.
    static int equalizeConnectedSizes(Diagram& diagram, Direction direction,
                                      float threshold = GROUP_THRESHOLD);

    /// Center the content on the page, keeping at least margin to its edges
    static int centerOnPage(Diagram& diagram, float margin = 50.0f);

    /// Shift the content so its top-left corner is at least margin from the origin
    static int ensurePageMargins(Diagram& diagram, float margin = 40.0f);

    /// Move connector labels that sit on a shape to the candidate offset
    /// (above, below, right, left, then diagonals) with the fewest collisions.
    /// Labels are placed relative to the midpoint between the endpoint centers.
    /// @return Number of labels whose offset changed
    static int positionEdgeLabels(Diagram& diagram, float margin = 8.0f);

    /// relayout, overlap resolution, compaction, alignment, size equalization,
    /// routing, optimization, label placement, page centering and margins
    static PolishReport polish(Diagram& diagram, Direction direction = Direction::TopToBottom);

    /// Move every top-level node and every connector waypoint by (dx, dy)
    static int translateContent(Diagram& diagram, float dx, float dy);

private:
    /// Split ids (sorted by key) wherever consecutive keys differ by more than threshold
    static std::vector<std::vector<NodeId>> groupByProximity(const std::vector<NodeId>& sortedIds,
                                                             const std::vector<float>& sortedKeys,
                                                             float threshold);
};

}  // namespace orthograph
