#include "orthograph/layout/config/LayoutResult.h"

#include <algorithm>

namespace orthograph {

void LayoutResult::setNodeLayout(NodeId id, const NodeLayout& layout) {
    NodeLayout stored = layout;
    stored.id = id;
    nodeLayouts_[id] = stored;
    if (!stored.label.empty()) {
        labelToNode_[stored.label] = id;
    }
}

const NodeLayout* LayoutResult::getNodeLayout(NodeId id) const {
    auto it = nodeLayouts_.find(id);
    return it != nodeLayouts_.end() ? &it->second : nullptr;
}

std::optional<NodeId> LayoutResult::nodeFor(const std::string& label) const {
    auto it = labelToNode_.find(label);
    if (it == labelToNode_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Rect LayoutResult::computeBounds() const {
    if (nodeLayouts_.empty()) {
        return {};
    }

    bool first = true;
    Rect total;
    for (const auto& [id, layout] : nodeLayouts_) {
        total = first ? layout.bounds() : total.united(layout.bounds());
        first = false;
    }
    return total;
}

void LayoutResult::clear() {
    nodeLayouts_.clear();
    labelToNode_.clear();
    connectors_.clear();
    layerCount_ = 0;
}

}  // namespace orthograph
