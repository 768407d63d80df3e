#include "orthograph/layout/LayeredGraph.h"

#include <algorithm>

namespace orthograph {

size_t LayeredGraph::addNode(const std::string& key, Size size) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return it->second;
    }

    size_t i = nodes_.size();
    LayerNode n;
    n.key = key;
    n.size = size;
    nodes_.push_back(std::move(n));
    upper_.emplace_back();
    lower_.emplace_back();
    index_.emplace(key, i);
    return i;
}

size_t LayeredGraph::addVirtualNode(int rank) {
    size_t i = nodes_.size();
    LayerNode n;
    n.size = {1.0f, 1.0f};
    n.rank = rank;
    n.isVirtual = true;
    nodes_.push_back(std::move(n));
    upper_.emplace_back();
    lower_.emplace_back();
    return i;
}

size_t LayeredGraph::addEdge(size_t source, size_t target, const std::string& label) {
    LayerEdge e;
    e.source = source;
    e.target = target;
    e.label = label;
    edges_.push_back(std::move(e));
    return edges_.size() - 1;
}

std::optional<size_t> LayeredGraph::indexOf(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<size_t> LayeredGraph::effectiveSuccessors(size_t i) const {
    std::vector<size_t> result;
    for (const auto& e : edges_) {
        if (!e.isSelfLoop() && e.effectiveSource() == i) {
            result.push_back(e.effectiveTarget());
        }
    }
    return result;
}

std::vector<size_t> LayeredGraph::effectivePredecessors(size_t i) const {
    std::vector<size_t> result;
    for (const auto& e : edges_) {
        if (!e.isSelfLoop() && e.effectiveTarget() == i) {
            result.push_back(e.effectiveSource());
        }
    }
    return result;
}

void LayeredGraph::addSegment(size_t upper, size_t lower) {
    segments_.emplace_back(upper, lower);
    lower_[upper].push_back(lower);
    upper_[lower].push_back(upper);
}

void LayeredGraph::buildRankBuckets() {
    ranks_.assign(static_cast<size_t>(maxRank()) + 1, {});
    if (nodes_.empty()) {
        ranks_.clear();
        return;
    }
    for (size_t i = 0; i < nodes_.size(); ++i) {
        auto& bucket = ranks_[static_cast<size_t>(nodes_[i].rank)];
        nodes_[i].order = static_cast<float>(bucket.size());
        bucket.push_back(i);
    }
}

int LayeredGraph::maxRank() const {
    int r = 0;
    for (const auto& n : nodes_) {
        r = std::max(r, n.rank);
    }
    return r;
}

size_t LayeredGraph::virtualNodeCount() const {
    return static_cast<size_t>(std::count_if(nodes_.begin(), nodes_.end(),
                                             [](const LayerNode& n) { return n.isVirtual; }));
}

}  // namespace orthograph
