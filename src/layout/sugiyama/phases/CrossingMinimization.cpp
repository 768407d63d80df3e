#include "CrossingMinimization.h"

#include <algorithm>

namespace orthograph {
namespace algorithms {

CrossingMinimizationResult BarycenterCrossingMinimization::minimize(
    LayeredGraph& graph, int passes) const {

    CrossingMinimizationResult result;
    auto& ranks = graph.ranks();

    if (ranks.size() >= 2) {
        const int maxRank = static_cast<int>(ranks.size()) - 1;
        for (int pass = 0; pass < passes; ++pass) {
            for (int r = 1; r <= maxRank; ++r) {
                sortRank(graph, ranks[static_cast<size_t>(r)], true);
            }
            for (int r = maxRank - 1; r >= 0; --r) {
                sortRank(graph, ranks[static_cast<size_t>(r)], false);
            }
            ++result.passesRun;
        }
    }

    result.crossingCount = countCrossings(graph);
    return result;
}

void BarycenterCrossingMinimization::sortRank(
    LayeredGraph& graph, std::vector<size_t>& rank, bool useUpper) const {

    std::vector<std::pair<float, size_t>> keyed;
    keyed.reserve(rank.size());
    for (size_t n : rank) {
        const auto& neighbors = useUpper ? graph.upperNeighbors(n) : graph.lowerNeighbors(n);
        float key = graph.node(n).order;
        if (!neighbors.empty()) {
            float sum = 0.0f;
            for (size_t m : neighbors) {
                sum += graph.node(m).order;
            }
            key = sum / static_cast<float>(neighbors.size());
        }
        keyed.emplace_back(key, n);
    }

    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    for (size_t i = 0; i < keyed.size(); ++i) {
        rank[i] = keyed[i].second;
        graph.node(rank[i]).order = static_cast<float>(i);
    }
}

int BarycenterCrossingMinimization::countCrossings(const LayeredGraph& graph) const {
    // Segments grouped by the rank of their upper end, as (upperOrder, lowerOrder)
    std::vector<std::vector<std::pair<float, float>>> byRank(graph.ranks().size());
    for (const auto& [upper, lower] : graph.segments()) {
        const auto& u = graph.node(upper);
        const auto& l = graph.node(lower);
        byRank[static_cast<size_t>(u.rank)].emplace_back(u.order, l.order);
    }

    int crossings = 0;
    for (const auto& segs : byRank) {
        for (size_t i = 0; i < segs.size(); ++i) {
            for (size_t j = i + 1; j < segs.size(); ++j) {
                bool upperInverted = segs[i].first < segs[j].first;
                bool lowerInverted = segs[i].second < segs[j].second;
                if (segs[i].first != segs[j].first && segs[i].second != segs[j].second &&
                    upperInverted != lowerInverted) {
                    ++crossings;
                }
            }
        }
    }
    return crossings;
}

}  // namespace algorithms
}  // namespace orthograph
