#pragma once

#include "../core/Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace orthograph {

/// Node record in the layered-layout arena
struct LayerNode {
    std::string key;          ///< Label; empty for virtual nodes
    Size size;
    int rank = 0;
    float order = 0.0f;       ///< Position within the rank, only used for sorting
    Point position;           ///< Top-left after coordinate assignment
    bool isVirtual = false;
    NodeId cellId = INVALID_NODE;  ///< Diagram node this record stands for, if any
};

/// Input edge between two arena nodes.
/// source/target keep the caller's direction; reversed marks a back-edge
/// that ranking and expansion must treat as target -> source.
struct LayerEdge {
    size_t source = 0;
    size_t target = 0;
    std::string label;
    bool reversed = false;
    EdgeId connector = INVALID_EDGE;

    size_t effectiveSource() const { return reversed ? target : source; }
    size_t effectiveTarget() const { return reversed ? source : target; }
    bool isSelfLoop() const { return source == target; }
};

/// Dense-index graph the Sugiyama phases operate on.
///
/// Labels map to indices once (addNode); afterwards every phase works on
/// index lists. Two adjacency views exist:
/// - effective: one entry per non-self-loop input edge, back-edges flipped
/// - expanded: unit-span segments after virtual node insertion
class LayeredGraph {
public:
    /// Add a real node, or return the existing index for a known key
    size_t addNode(const std::string& key, Size size);
    size_t addVirtualNode(int rank);
    size_t addEdge(size_t source, size_t target, const std::string& label = "");

    std::optional<size_t> indexOf(const std::string& key) const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    LayerNode& node(size_t i) { return nodes_[i]; }
    const LayerNode& node(size_t i) const { return nodes_[i]; }
    LayerEdge& edge(size_t i) { return edges_[i]; }
    const LayerEdge& edge(size_t i) const { return edges_[i]; }

    std::vector<LayerNode>& nodes() { return nodes_; }
    const std::vector<LayerNode>& nodes() const { return nodes_; }
    const std::vector<LayerEdge>& edges() const { return edges_; }

    /// Successors/predecessors along effective (cycle-free) directions.
    /// Self-loops are excluded.
    std::vector<size_t> effectiveSuccessors(size_t i) const;
    std::vector<size_t> effectivePredecessors(size_t i) const;

    // Expanded (unit-span) adjacency
    void addSegment(size_t upper, size_t lower);
    const std::vector<size_t>& upperNeighbors(size_t i) const { return upper_[i]; }
    const std::vector<size_t>& lowerNeighbors(size_t i) const { return lower_[i]; }
    const std::vector<std::pair<size_t, size_t>>& segments() const { return segments_; }

    // Rank buckets, each in current order
    std::vector<std::vector<size_t>>& ranks() { return ranks_; }
    const std::vector<std::vector<size_t>>& ranks() const { return ranks_; }

    /// Bucket nodes by rank in arena order and set order = index within rank
    void buildRankBuckets();
    int maxRank() const;

    size_t virtualNodeCount() const;

private:
    std::vector<LayerNode> nodes_;
    std::vector<LayerEdge> edges_;
    std::unordered_map<std::string, size_t> index_;

    std::vector<std::vector<size_t>> upper_;
    std::vector<std::vector<size_t>> lower_;
    std::vector<std::pair<size_t, size_t>> segments_;

    std::vector<std::vector<size_t>> ranks_;
};

}  // namespace orthograph
