#include "orthograph/core/Diagram.h"

namespace orthograph {

NodeId Diagram::addNode(const std::string& label, const Rect& geometry,
                        const std::string& style, NodeId parent) {
    NodeData data;
    data.label = label;
    data.geometry = geometry;
    data.style = style;
    data.parent = parent;
    return addNode(data);
}

NodeId Diagram::addNode(const NodeData& data) {
    NodeId id = static_cast<NodeId>(nodes_.size());

    NodeData nodeData = data;
    nodeData.id = id;
    if (nodeData.parent != INVALID_NODE && !hasNode(nodeData.parent)) {
        throw std::invalid_argument("Unknown parent node ID: " + std::to_string(nodeData.parent));
    }

    nodes_.push_back(std::move(nodeData));
    nodeValid_.push_back(true);
    ++validNodeCount_;
    return id;
}

void Diagram::removeNode(NodeId id) {
    if (!hasNode(id)) return;

    const NodeData& removed = nodes_[id];
    for (NodeId child : children(id)) {
        NodeData& c = nodes_[child];
        c.geometry = c.geometry.translated(removed.geometry.x, removed.geometry.y);
        c.parent = removed.parent;
    }

    nodeValid_[id] = false;
    --validNodeCount_;
}

bool Diagram::hasNode(NodeId id) const {
    return id < nodeValid_.size() && nodeValid_[id];
}

const NodeData& Diagram::getNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

NodeData& Diagram::getNode(NodeId id) {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

std::optional<NodeData> Diagram::tryGetNode(NodeId id) const {
    if (!hasNode(id)) {
        return std::nullopt;
    }
    return nodes_[id];
}

void Diagram::setNodeGeometry(NodeId id, const Rect& geometry) {
    getNode(id).geometry = geometry;
}

void Diagram::setNodePosition(NodeId id, Point relativePosition) {
    Rect& g = getNode(id).geometry;
    g.x = relativePosition.x;
    g.y = relativePosition.y;
}

void Diagram::setNodeSize(NodeId id, Size size) {
    Rect& g = getNode(id).geometry;
    g.width = size.width;
    g.height = size.height;
}

void Diagram::setAbsolutePosition(NodeId id, Point position) {
    NodeData& node = getNode(id);
    Point origin{0.0f, 0.0f};
    if (node.parent != INVALID_NODE) {
        if (auto parentBox = absoluteBounds(node.parent)) {
            origin = parentBox->position();
        }
    }
    node.geometry.x = position.x - origin.x;
    node.geometry.y = position.y - origin.y;
}

void Diagram::setParent(NodeId id, NodeId parent) {
    NodeData& node = getNode(id);
    if (parent != INVALID_NODE) {
        if (!hasNode(parent)) {
            throw std::invalid_argument("Unknown parent node ID: " + std::to_string(parent));
        }
        if (parent == id || isAncestorOf(id, parent)) {
            throw std::invalid_argument("Containment cycle: node " + std::to_string(id) +
                                        " cannot be placed inside node " + std::to_string(parent));
        }
    }
    node.parent = parent;
}

std::vector<NodeId> Diagram::nodes() const {
    std::vector<NodeId> result;
    result.reserve(validNodeCount_);
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (nodeValid_[id]) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<NodeId> Diagram::topLevelNodes() const {
    return children(INVALID_NODE);
}

std::vector<NodeId> Diagram::children(NodeId parent) const {
    std::vector<NodeId> result;
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (nodeValid_[id] && nodes_[id].parent == parent) {
            result.push_back(id);
        }
    }
    return result;
}

bool Diagram::isAncestorOf(NodeId ancestor, NodeId id) const {
    if (!hasNode(id) || ancestor == INVALID_NODE) return false;

    // Parent chains are at most nodeCount long; anything longer is a cycle
    NodeId current = nodes_[id].parent;
    for (size_t steps = 0; current != INVALID_NODE && steps <= nodes_.size(); ++steps) {
        if (current == ancestor) return true;
        if (!hasNode(current)) return false;
        current = nodes_[current].parent;
    }
    return false;
}

std::optional<Rect> Diagram::absoluteBounds(NodeId id) const {
    if (!hasNode(id)) {
        return std::nullopt;
    }

    Rect box = nodes_[id].geometry;
    NodeId current = nodes_[id].parent;
    for (size_t steps = 0; current != INVALID_NODE && steps <= nodes_.size(); ++steps) {
        if (!hasNode(current)) break;
        const Rect& pg = nodes_[current].geometry;
        box.x += pg.x;
        box.y += pg.y;
        current = nodes_[current].parent;
    }
    return box;
}

std::unordered_map<NodeId, Rect> Diagram::allAbsoluteBounds() const {
    std::unordered_map<NodeId, Rect> result;
    result.reserve(validNodeCount_);
    for (NodeId id : nodes()) {
        if (auto box = absoluteBounds(id)) {
            result.emplace(id, *box);
        }
    }
    return result;
}

EdgeId Diagram::addConnector(NodeId source, NodeId target,
                             const std::string& label, const std::string& style) {
    EdgeId id = static_cast<EdgeId>(connectors_.size());

    ConnectorData data;
    data.id = id;
    data.source = source;
    data.target = target;
    data.label = label;
    data.style = style;

    connectors_.push_back(std::move(data));
    connectorValid_.push_back(true);
    ++validConnectorCount_;
    return id;
}

void Diagram::removeConnector(EdgeId id) {
    if (!hasConnector(id)) return;
    connectorValid_[id] = false;
    --validConnectorCount_;
}

bool Diagram::hasConnector(EdgeId id) const {
    return id < connectorValid_.size() && connectorValid_[id];
}

const ConnectorData& Diagram::getConnector(EdgeId id) const {
    if (!hasConnector(id)) {
        throw std::out_of_range("Invalid connector ID: " + std::to_string(id));
    }
    return connectors_[id];
}

ConnectorData& Diagram::getConnector(EdgeId id) {
    if (!hasConnector(id)) {
        throw std::out_of_range("Invalid connector ID: " + std::to_string(id));
    }
    return connectors_[id];
}

std::optional<ConnectorData> Diagram::tryGetConnector(EdgeId id) const {
    if (!hasConnector(id)) {
        return std::nullopt;
    }
    return connectors_[id];
}

std::vector<EdgeId> Diagram::connectors() const {
    std::vector<EdgeId> result;
    result.reserve(validConnectorCount_);
    for (EdgeId id = 0; id < connectors_.size(); ++id) {
        if (connectorValid_[id]) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<Point>& Diagram::waypoints(EdgeId id) {
    return getConnector(id).waypoints;
}

const std::vector<Point>& Diagram::waypoints(EdgeId id) const {
    return getConnector(id).waypoints;
}

void Diagram::setWaypoints(EdgeId id, std::vector<Point> points) {
    getConnector(id).waypoints = std::move(points);
}

void Diagram::setPorts(EdgeId id, std::optional<PortAnchor> exitPort,
                       std::optional<PortAnchor> entryPort) {
    ConnectorData& c = getConnector(id);
    c.exitPort = exitPort;
    c.entryPort = entryPort;
}

void Diagram::clear() {
    nodes_.clear();
    nodeValid_.clear();
    connectors_.clear();
    connectorValid_.clear();
    validNodeCount_ = 0;
    validConnectorCount_ = 0;
}

}  // namespace orthograph
