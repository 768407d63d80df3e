#pragma once

#include "../../core/Types.h"

#include <optional>
#include <string>

namespace orthograph {

/// Direction of the layered layout
enum class Direction {
    TopToBottom,   // Rank 0 at the top
    BottomToTop,   // Rank 0 at the bottom
    LeftToRight,   // Rank 0 on the left
    RightToLeft    // Rank 0 on the right
};

/// True when ranks stack vertically (rows), false for columns
inline bool isVertical(Direction d) {
    return d == Direction::TopToBottom || d == Direction::BottomToTop;
}

/// "TB", "BT", "LR", "RL"
const char* directionCode(Direction d);
/// Parse "TB"/"BT"/"LR"/"RL" (case-insensitive)
std::optional<Direction> parseDirection(const std::string& code);

/// Options for the layered (Sugiyama) layout. All distances are pixels.
struct LayoutOptions {
    Direction direction = Direction::TopToBottom;

    // Spacing
    float rankSpacing = 100.0f;   // Gap between consecutive ranks
    float nodeSpacing = 60.0f;    // Gap between nodes of one rank

    // Nodes never shrink below the default size
    float defaultNodeWidth = 120.0f;
    float defaultNodeHeight = 60.0f;

    float gridSize = 10.0f;

    // Overlap removal
    int maxOverlapIterations = 50;
    float overlapPadding = 20.0f;

    // Crossing minimization sweeps (forward + backward each)
    int crossingMinimizationPasses = 4;

    // Connector routing
    float edgeMargin = 15.0f;     // Clearance kept around shapes
    bool routeEdges = true;

    // Top-left of rank 0 / of the widest rank
    float startX = 50.0f;
    float startY = 80.0f;

    Size defaultNodeSize() const { return {defaultNodeWidth, defaultNodeHeight}; }

    // Builder pattern
    LayoutOptions& setDirection(Direction d) { direction = d; return *this; }
    LayoutOptions& setSpacing(float rank, float node) {
        rankSpacing = rank;
        nodeSpacing = node;
        return *this;
    }
    LayoutOptions& setDefaultNodeSize(Size s) {
        defaultNodeWidth = s.width;
        defaultNodeHeight = s.height;
        return *this;
    }
    LayoutOptions& setGridSize(float g) { gridSize = g; return *this; }
    LayoutOptions& setOverlapRemoval(int maxIterations, float padding) {
        maxOverlapIterations = maxIterations;
        overlapPadding = padding;
        return *this;
    }
    LayoutOptions& setCrossingMinimizationPasses(int passes) {
        crossingMinimizationPasses = passes;
        return *this;
    }
    LayoutOptions& setEdgeMargin(float m) { edgeMargin = m; return *this; }
    LayoutOptions& setRouteEdges(bool enabled) { routeEdges = enabled; return *this; }
    LayoutOptions& setOrigin(float x, float y) {
        startX = x;
        startY = y;
        return *this;
    }

    /// Tighter spacing for dense diagrams
    static LayoutOptions compact() {
        LayoutOptions o;
        o.rankSpacing = 60.0f;
        o.nodeSpacing = 40.0f;
        o.overlapPadding = 10.0f;
        return o;
    }

    /// Roomier spacing for presentation diagrams
    static LayoutOptions spacious() {
        LayoutOptions o;
        o.rankSpacing = 140.0f;
        o.nodeSpacing = 90.0f;
        o.overlapPadding = 30.0f;
        return o;
    }
};

/// Tuning for the obstacle-aware router
struct RouterOptions {
    float margin = 15.0f;          // Clearance around obstacles
    float gridSize = 10.0f;        // Snap unit for waypoints and grid lines
    float bendPenalty = 5.0f;      // Extra cost per direction change
    int maxExpansions = 50000;     // A* gives up (and falls back) after this

    RouterOptions& setMargin(float m) { margin = m; return *this; }
    RouterOptions& setGridSize(float g) { gridSize = g; return *this; }
    RouterOptions& setBendPenalty(float p) { bendPenalty = p; return *this; }
    RouterOptions& setMaxExpansions(int n) { maxExpansions = n; return *this; }
};

/// Tuning for the post-routing path optimizer
struct OptimizerOptions {
    float margin = 15.0f;               // Obstacle clearance for shortening/centering
    float straightenThreshold = 8.0f;   // Max off-axis drift that gets straightened
    float nudgeSpacing = 10.0f;         // Distance between separated parallel segments

    // Individual passes can be switched off
    bool removeCollinear = true;
    bool straighten = true;
    bool shortenDetours = true;
    bool centerInChannels = true;
    bool separateParallel = true;

    OptimizerOptions& setMargin(float m) { margin = m; return *this; }
    OptimizerOptions& setStraightenThreshold(float t) { straightenThreshold = t; return *this; }
    OptimizerOptions& setNudgeSpacing(float s) { nudgeSpacing = s; return *this; }
};

/// Options for the simple row/column/grid/tree helpers
struct ArrangeOptions {
    float startX = 50.0f;
    float startY = 50.0f;
    float horizontalSpacing = 60.0f;
    float verticalSpacing = 60.0f;
    float defaultWidth = 120.0f;
    float defaultHeight = 60.0f;
    float gridSize = 10.0f;

    Size defaultNodeSize() const { return {defaultWidth, defaultHeight}; }

    ArrangeOptions& setStart(float x, float y) { startX = x; startY = y; return *this; }
    ArrangeOptions& setSpacing(float h, float v) {
        horizontalSpacing = h;
        verticalSpacing = v;
        return *this;
    }
    ArrangeOptions& setDefaultNodeSize(Size s) {
        defaultWidth = s.width;
        defaultHeight = s.height;
        return *this;
    }
    ArrangeOptions& setGridSize(float g) { gridSize = g; return *this; }
};

}  // namespace orthograph
