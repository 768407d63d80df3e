#pragma once

#include "orthograph/layout/api/ICrossingMinimization.h"

#include <vector>

namespace orthograph {
namespace algorithms {

/// Layer-by-layer barycenter sweeps.
///
/// Each pass is a forward sweep (ranks 1..max ordered by the mean order of
/// upper neighbors) followed by a backward sweep (ranks max-1..0 ordered by
/// lower neighbors). Nodes without neighbors on the fixed side keep their
/// current order as key. Sorting is stable, so ties keep the previous order.
class BarycenterCrossingMinimization : public ICrossingMinimization {
public:
    BarycenterCrossingMinimization() = default;

    const char* algorithmName() const override { return "Barycenter"; }

    CrossingMinimizationResult minimize(LayeredGraph& graph, int passes) const override;

    int countCrossings(const LayeredGraph& graph) const override;

private:
    void sortRank(LayeredGraph& graph, std::vector<size_t>& rank, bool useUpper) const;
};

}  // namespace algorithms
}  // namespace orthograph
