#pragma once

#include "../../core/Types.h"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace orthograph {

/// Positioned node produced by a layout run
struct NodeLayout {
    NodeId id = INVALID_NODE;
    std::string label;
    Point position;           // Absolute top-left corner
    Size size;
    int layer = 0;            // Rank
    int order = 0;            // Index within the rank after crossing minimization

    Point center() const {
        return {position.x + size.width / 2, position.y + size.height / 2};
    }

    Rect bounds() const {
        return {position.x, position.y, size.width, size.height};
    }
};

/// Output of a layered layout: where every real node went and which
/// connectors were created for the input edges.
class LayoutResult {
public:
    LayoutResult() = default;

    void setNodeLayout(NodeId id, const NodeLayout& layout);
    const NodeLayout* getNodeLayout(NodeId id) const;
    bool hasNode(NodeId id) const { return nodeLayouts_.count(id) > 0; }

    /// Node created (or reused) for a label
    std::optional<NodeId> nodeFor(const std::string& label) const;
    const std::map<std::string, NodeId>& labelToNode() const { return labelToNode_; }

    void addConnector(EdgeId id) { connectors_.push_back(id); }
    const std::vector<EdgeId>& connectors() const { return connectors_; }

    const std::unordered_map<NodeId, NodeLayout>& nodeLayouts() const { return nodeLayouts_; }

    size_t nodeCount() const { return nodeLayouts_.size(); }
    size_t connectorCount() const { return connectors_.size(); }

    int layerCount() const { return layerCount_; }
    void setLayerCount(int count) { layerCount_ = count; }

    /// Union of all node boxes; empty Rect when there are no nodes
    Rect computeBounds() const;

    void clear();

private:
    std::unordered_map<NodeId, NodeLayout> nodeLayouts_;
    std::map<std::string, NodeId> labelToNode_;
    std::vector<EdgeId> connectors_;
    int layerCount_ = 0;
};

}  // namespace orthograph
