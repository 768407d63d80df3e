#pragma once

#include "../core/Diagram.h"
#include "config/LayoutOptions.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orthograph {

/// Parent label followed by its child labels, in insertion order
using TreeAdjacency = std::vector<std::pair<std::string, std::vector<std::string>>>;

/// Lightweight placement helpers for callers that do not need the full
/// layered algorithm. Every created node uses the default node size of
/// the options and sits on the grid.
class Arrangement {
public:
    /// Place one node per label in a row
    /// @param y Row coordinate, options.startY when absent
    static std::vector<NodeId> layoutHorizontal(Diagram& diagram,
                                                const std::vector<std::string>& labels,
                                                const ArrangeOptions& options = {},
                                                std::optional<float> y = std::nullopt,
                                                const std::string& style = styles::DEFAULT_NODE);

    /// Place one node per label in a column
    /// @param x Column coordinate, options.startX when absent
    static std::vector<NodeId> layoutVertical(Diagram& diagram,
                                              const std::vector<std::string>& labels,
                                              const ArrangeOptions& options = {},
                                              std::optional<float> x = std::nullopt,
                                              const std::string& style = styles::DEFAULT_NODE);

    /// Row-major grid. columns < 1 is treated as 1.
    static std::vector<NodeId> layoutGrid(Diagram& diagram,
                                          const std::vector<std::string>& labels,
                                          int columns = 3,
                                          const ArrangeOptions& options = {},
                                          const std::string& style = styles::DEFAULT_NODE);

    /// Tree placement: BFS levels from root, one forward (parents) and one
    /// backward (children) barycenter sweep, every level centered against
    /// the widest one. Nodes unreachable from root are not created.
    /// Connectors are added for every adjacency pair with both ends placed.
    /// @return label -> created node id
    static std::map<std::string, NodeId> layoutTree(Diagram& diagram,
                                                    const TreeAdjacency& adjacency,
                                                    const std::string& root,
                                                    const ArrangeOptions& options = {},
                                                    Direction direction = Direction::TopToBottom,
                                                    const std::string& style = styles::DEFAULT_NODE,
                                                    const std::string& connectorStyle = styles::TREE_CONNECTOR);

    /// Connect consecutive nodes; labels[i] (when present) names the i-th connector
    static std::vector<EdgeId> connectChain(Diagram& diagram,
                                            const std::vector<NodeId>& nodes,
                                            const std::vector<std::string>& labels = {},
                                            const std::string& style = styles::CHAIN_CONNECTOR);

    /// Spread items of the given sizes between start and end with equal gaps
    /// (at least MIN_GAP). Returns the new leading coordinate of each item.
    static std::vector<float> distributeEvenly(const std::vector<float>& sizes,
                                               float start, float end);

    static constexpr float MIN_GAP = 10.0f;
};

}  // namespace orthograph
