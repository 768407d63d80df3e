#include "orthograph/layout/Arrangement.h"
#include "orthograph/core/GeometryUtils.h"
#include "orthograph/common/Logger.h"

#include <algorithm>
#include <deque>
#include <unordered_map>

namespace orthograph {

std::vector<NodeId> Arrangement::layoutHorizontal(Diagram& diagram,
                                                   const std::vector<std::string>& labels,
                                                   const ArrangeOptions& options,
                                                   std::optional<float> y,
                                                   const std::string& style) {
    const Size size = options.defaultNodeSize();
    const float rowY = grid::snapToGrid(y.value_or(options.startY), options.gridSize);

    std::vector<NodeId> ids;
    ids.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        float x = grid::snapToGrid(options.startX + static_cast<float>(i) * (size.width + options.horizontalSpacing),
                                   options.gridSize);
        ids.push_back(diagram.addNode(labels[i], Rect{x, rowY, size.width, size.height}, style));
    }
    return ids;
}

std::vector<NodeId> Arrangement::layoutVertical(Diagram& diagram,
                                                const std::vector<std::string>& labels,
                                                const ArrangeOptions& options,
                                                std::optional<float> x,
                                                const std::string& style) {
    const Size size = options.defaultNodeSize();
    const float colX = grid::snapToGrid(x.value_or(options.startX), options.gridSize);

    std::vector<NodeId> ids;
    ids.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        float y = grid::snapToGrid(options.startY + static_cast<float>(i) * (size.height + options.verticalSpacing),
                                   options.gridSize);
        ids.push_back(diagram.addNode(labels[i], Rect{colX, y, size.width, size.height}, style));
    }
    return ids;
}

std::vector<NodeId> Arrangement::layoutGrid(Diagram& diagram,
                                            const std::vector<std::string>& labels,
                                            int columns,
                                            const ArrangeOptions& options,
                                            const std::string& style) {
    const Size size = options.defaultNodeSize();
    const size_t cols = static_cast<size_t>(std::max(1, columns));

    std::vector<NodeId> ids;
    ids.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        auto col = static_cast<float>(i % cols);
        auto row = static_cast<float>(i / cols);
        float x = grid::snapToGrid(options.startX + col * (size.width + options.horizontalSpacing), options.gridSize);
        float y = grid::snapToGrid(options.startY + row * (size.height + options.verticalSpacing), options.gridSize);
        ids.push_back(diagram.addNode(labels[i], Rect{x, y, size.width, size.height}, style));
    }
    return ids;
}

std::map<std::string, NodeId> Arrangement::layoutTree(Diagram& diagram,
                                                      const TreeAdjacency& adjacency,
                                                      const std::string& root,
                                                      const ArrangeOptions& options,
                                                      Direction direction,
                                                      const std::string& style,
                                                      const std::string& connectorStyle) {
    std::unordered_map<std::string, const std::vector<std::string>*> childrenOf;
    std::unordered_map<std::string, std::vector<std::string>> parentsOf;
    for (const auto& [parent, children] : adjacency) {
        if (!childrenOf.count(parent)) childrenOf[parent] = &children;
        for (const auto& child : children) {
            parentsOf[child].push_back(parent);
        }
    }

    // BFS levels
    std::unordered_map<std::string, int> level{{root, 0}};
    std::vector<std::vector<std::string>> levels{{root}};
    std::deque<std::string> queue{root};
    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        auto it = childrenOf.find(current);
        if (it == childrenOf.end()) continue;
        for (const auto& child : *it->second) {
            if (level.count(child)) continue;
            int l = level[current] + 1;
            level[child] = l;
            if (static_cast<int>(levels.size()) <= l) levels.resize(static_cast<size_t>(l) + 1);
            levels[static_cast<size_t>(l)].push_back(child);
            queue.push_back(child);
        }
    }

    const int maxLevel = static_cast<int>(levels.size()) - 1;
    std::unordered_map<std::string, float> position;
    for (size_t i = 0; i < levels[0].size(); ++i) {
        position[levels[0][i]] = static_cast<float>(i);
    }

    auto sortLevel = [&position](std::vector<std::string>& nodes,
                                 const std::unordered_map<std::string, float>& keys) {
        std::stable_sort(nodes.begin(), nodes.end(),
                         [&keys](const std::string& a, const std::string& b) { return keys.at(a) < keys.at(b); });
        for (size_t i = 0; i < nodes.size(); ++i) {
            position[nodes[i]] = static_cast<float>(i);
        }
    };

    // Forward sweep: order by parents
    for (int l = 1; l <= maxLevel; ++l) {
        auto& nodes = levels[static_cast<size_t>(l)];
        std::unordered_map<std::string, float> keys;
        for (size_t i = 0; i < nodes.size(); ++i) {
            float sum = 0.0f;
            int count = 0;
            auto pit = parentsOf.find(nodes[i]);
            if (pit != parentsOf.end()) {
                for (const auto& p : pit->second) {
                    auto pos = position.find(p);
                    if (pos == position.end()) continue;
                    sum += pos->second;
                    ++count;
                }
            }
            keys[nodes[i]] = count > 0 ? sum / static_cast<float>(count) : static_cast<float>(i);
        }
        sortLevel(nodes, keys);
    }

    // Backward sweep: order by children
    for (int l = maxLevel - 1; l >= 0; --l) {
        auto& nodes = levels[static_cast<size_t>(l)];
        std::unordered_map<std::string, float> keys;
        for (const auto& node : nodes) {
            float sum = 0.0f;
            int count = 0;
            auto cit = childrenOf.find(node);
            if (cit != childrenOf.end()) {
                for (const auto& c : *cit->second) {
                    auto pos = position.find(c);
                    if (pos == position.end()) continue;
                    sum += pos->second;
                    ++count;
                }
            }
            keys[node] = count > 0 ? sum / static_cast<float>(count) : position[node];
        }
        sortLevel(nodes, keys);
    }

    const Size size = options.defaultNodeSize();
    const bool vertical = isVertical(direction);
    const float crossExtent = vertical ? size.width : size.height;
    const float crossGap = vertical ? options.horizontalSpacing : options.verticalSpacing;
    const float rankStep = vertical ? size.height + options.verticalSpacing
                                    : size.width + options.horizontalSpacing;

    size_t widest = 0;
    for (const auto& nodes : levels) widest = std::max(widest, nodes.size());
    const float maxTotal = static_cast<float>(widest) * crossExtent + static_cast<float>(widest - 1) * crossGap;

    std::map<std::string, NodeId> result;
    for (int l = 0; l <= maxLevel; ++l) {
        const auto& nodes = levels[static_cast<size_t>(l)];
        auto count = static_cast<float>(nodes.size());
        float total = count * crossExtent + (count - 1.0f) * crossGap;
        float offset = (maxTotal - total) / 2.0f;

        bool flipped = direction == Direction::BottomToTop || direction == Direction::RightToLeft;
        float rank = static_cast<float>(flipped ? maxLevel - l : l) * rankStep;

        for (size_t i = 0; i < nodes.size(); ++i) {
            float cross = offset + static_cast<float>(i) * (crossExtent + crossGap);
            float x = options.startX + (vertical ? cross : rank);
            float y = options.startY + (vertical ? rank : cross);
            Rect box{grid::snapToGrid(x, options.gridSize), grid::snapToGrid(y, options.gridSize),
                     size.width, size.height};
            result[nodes[i]] = diagram.addNode(nodes[i], box, style);
        }
    }

    for (const auto& [parent, children] : adjacency) {
        auto p = result.find(parent);
        if (p == result.end()) continue;
        for (const auto& child : children) {
            auto c = result.find(child);
            if (c == result.end()) continue;
            diagram.addConnector(p->second, c->second, "", connectorStyle);
        }
    }

    LOG_DEBUG("tree '{}' placed {} nodes on {} levels", root, result.size(), levels.size());
    return result;
}

std::vector<EdgeId> Arrangement::connectChain(Diagram& diagram,
                                              const std::vector<NodeId>& nodes,
                                              const std::vector<std::string>& labels,
                                              const std::string& style) {
    std::vector<EdgeId> ids;
    for (size_t i = 0; i + 1 < nodes.size(); ++i) {
        const std::string label = i < labels.size() ? labels[i] : std::string{};
        ids.push_back(diagram.addConnector(nodes[i], nodes[i + 1], label, style));
    }
    return ids;
}

std::vector<float> Arrangement::distributeEvenly(const std::vector<float>& sizes,
                                                 float start, float end) {
    std::vector<float> result;
    if (sizes.empty()) return result;
    if (sizes.size() == 1) {
        result.push_back(start);
        return result;
    }

    float totalSize = 0.0f;
    for (float s : sizes) totalSize += s;
    float gap = ((end - start) - totalSize) / static_cast<float>(sizes.size() - 1);
    gap = std::max(gap, MIN_GAP);

    float current = start;
    for (float s : sizes) {
        result.push_back(current);
        current += s + gap;
    }
    return result;
}

}  // namespace orthograph
