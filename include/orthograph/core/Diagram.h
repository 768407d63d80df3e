#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace orthograph {

/// Default style strings attached to cells created by the layout helpers
namespace styles {
inline constexpr const char* DEFAULT_NODE = "rounded=1;whiteSpace=wrap;html=1;";
inline constexpr const char* LAYERED_CONNECTOR =
    "edgeStyle=orthogonalEdgeStyle;rounded=1;orthogonalLoop=1;jettySize=auto;html=1;endArrow=classic;";
inline constexpr const char* TREE_CONNECTOR =
    "edgeStyle=orthogonalEdgeStyle;rounded=0;html=1;endArrow=classic;";
inline constexpr const char* CHAIN_CONNECTOR = "endArrow=classic;html=1;";
}  // namespace styles

/// Side of a node box a connector attaches to
enum class PortSide {
    Top,
    Bottom,
    Left,
    Right
};

/// Connection point relative to a node box: (0,0) top-left, (1,1) bottom-right
struct PortAnchor {
    float x = 0.5f;
    float y = 0.5f;

    constexpr bool operator==(const PortAnchor& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const PortAnchor& o) const { return !(*this == o); }
};

struct NodeData {
    NodeId id = INVALID_NODE;
    std::string label;
    std::string style = styles::DEFAULT_NODE;
    Rect geometry;                ///< Relative to the parent container
    NodeId parent = INVALID_NODE; ///< INVALID_NODE for top-level nodes
};

struct ConnectorData {
    EdgeId id = INVALID_EDGE;
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    std::string label;
    std::string style = styles::LAYERED_CONNECTOR;
    std::vector<Point> waypoints;  ///< Absolute, source and target excluded
    std::optional<PortAnchor> exitPort;
    std::optional<PortAnchor> entryPort;
    std::optional<Point> labelOffset;  ///< Label shift from the connector midpoint
};

struct PageSettings {
    float width = 827.0f;
    float height = 1169.0f;
};

/// In-memory diagram document: nodes (optionally nested in containers) and
/// connectors with orthogonal waypoints.
///
/// Node geometry is stored relative to the parent container; layout code
/// works on absolute boxes obtained from absoluteBounds().
/// Connector endpoints are not validated, so a connector may reference a
/// node that was never added or was removed later.
class Diagram {
public:
    Diagram() = default;

    // Node operations
    NodeId addNode(const std::string& label, const Rect& geometry,
                   const std::string& style = styles::DEFAULT_NODE,
                   NodeId parent = INVALID_NODE);
    NodeId addNode(const NodeData& data);

    /// Remove a node. Its children move up to its parent and keep their
    /// absolute position. Connectors touching it are left in place.
    void removeNode(NodeId id);
    bool hasNode(NodeId id) const;

    // Node access API:
    // - getNode(): throws std::out_of_range for unknown ids. The reference is
    //   invalidated by addNode()/removeNode().
    // - tryGetNode(): copy, std::nullopt for unknown ids.
    const NodeData& getNode(NodeId id) const;
    NodeData& getNode(NodeId id);
    std::optional<NodeData> tryGetNode(NodeId id) const;

    void setNodeGeometry(NodeId id, const Rect& geometry);
    void setNodePosition(NodeId id, Point relativePosition);
    void setNodeSize(NodeId id, Size size);

    /// Place a node so its absolute top-left lands on position
    void setAbsolutePosition(NodeId id, Point position);

    /// Re-parent a node, keeping its relative geometry.
    /// Throws std::invalid_argument if this would create a containment cycle.
    void setParent(NodeId id, NodeId parent);

    /// All live nodes in ascending id order
    std::vector<NodeId> nodes() const;
    std::vector<NodeId> topLevelNodes() const;
    std::vector<NodeId> children(NodeId parent) const;

    /// True when ancestor appears on id's parent chain
    bool isAncestorOf(NodeId ancestor, NodeId id) const;

    /// Absolute box with nested container offsets applied, nullopt for unknown ids
    std::optional<Rect> absoluteBounds(NodeId id) const;
    std::unordered_map<NodeId, Rect> allAbsoluteBounds() const;

    // Connector operations
    EdgeId addConnector(NodeId source, NodeId target,
                        const std::string& label = "",
                        const std::string& style = styles::LAYERED_CONNECTOR);
    void removeConnector(EdgeId id);
    bool hasConnector(EdgeId id) const;

    const ConnectorData& getConnector(EdgeId id) const;
    ConnectorData& getConnector(EdgeId id);
    std::optional<ConnectorData> tryGetConnector(EdgeId id) const;

    /// All live connectors in ascending id order
    std::vector<EdgeId> connectors() const;

    std::vector<Point>& waypoints(EdgeId id);
    const std::vector<Point>& waypoints(EdgeId id) const;
    void setWaypoints(EdgeId id, std::vector<Point> points);
    void setPorts(EdgeId id, std::optional<PortAnchor> exitPort,
                  std::optional<PortAnchor> entryPort);

    size_t nodeCount() const { return validNodeCount_; }
    size_t connectorCount() const { return validConnectorCount_; }

    /// Snap unit for every coordinate written by the layout code
    float gridSize() const { return gridSize_; }
    void setGridSize(float gridSize) { gridSize_ = gridSize; }

    const PageSettings& page() const { return page_; }
    PageSettings& page() { return page_; }

    void clear();

private:
    std::vector<NodeData> nodes_;
    std::vector<bool> nodeValid_;
    std::vector<ConnectorData> connectors_;
    std::vector<bool> connectorValid_;

    size_t validNodeCount_ = 0;
    size_t validConnectorCount_ = 0;

    float gridSize_ = 10.0f;
    PageSettings page_;
};

}  // namespace orthograph
