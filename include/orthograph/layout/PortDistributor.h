#pragma once

#include "../core/Diagram.h"

#include <unordered_map>
#include <utility>
#include <vector>

namespace orthograph {

/// Exit/entry anchors for one connection
struct PortAssignment {
    PortAnchor exit;
    PortAnchor entry;

    bool operator==(const PortAssignment& o) const { return exit == o.exit && entry == o.entry; }
};

/// Preferred connection axis for chooseBestPorts()
enum class PortPreference {
    Auto,
    Horizontal,
    Vertical
};

/// Picks connection points on node sides so that connectors sharing a side
/// fan out instead of stacking on the side center.
class PortDistributor {
public:
    /// Dominance ratio used by chooseBestPorts() in Auto mode
    static constexpr float AUTO_DOMINANCE_RATIO = 1.5f;
    /// Dominance ratio used by determineSides()
    static constexpr float SIDE_DOMINANCE_RATIO = 1.2f;
    /// Distance kept from the corners when spreading ports, as a side fraction
    static constexpr float CORNER_MARGIN = 0.15f;

    /// Side-center ports for a single connection
    static PortAssignment chooseBestPorts(const Rect& source, const Rect& target,
                                          PortPreference preference = PortPreference::Auto);

    /// (exit side, entry side). Diagonal connections prefer a vertical pair.
    static std::pair<PortSide, PortSide> determineSides(const Rect& source, const Rect& target);

    /// Center anchor of a side
    static PortAnchor sideCenter(PortSide side);

    /// Anchor of the index-th of count ports sharing one side
    static PortAnchor distributeOnSide(PortSide side, int count, int index);

    /// Assign anchors for a batch of (source, target) connections.
    /// Connections sharing a node side are ordered by the other endpoint's
    /// center along that side. Connections with a missing box use the
    /// right/left sides.
    /// @return One assignment per connection, in input order
    static std::vector<PortAssignment> distributeForBatch(
        const std::vector<std::pair<NodeId, NodeId>>& connections,
        const std::unordered_map<NodeId, Rect>& bounds);

    /// Distribute and store exit/entry anchors for the given connectors.
    /// Unknown connector ids are skipped.
    /// @return Number of connectors updated
    static int applyToDiagram(Diagram& diagram, const std::vector<EdgeId>& connectors);
};

}  // namespace orthograph
