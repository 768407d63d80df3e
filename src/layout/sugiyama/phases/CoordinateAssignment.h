#pragma once

#include "orthograph/layout/api/ICoordinateAssignment.h"

#include <vector>

namespace orthograph {
namespace algorithms {

/// Rank-stacked coordinate assignment.
///
/// Primary axis: ranks are stacked from the origin, each advancing by its
/// largest real extent plus rankSpacing (ranks without real nodes use the
/// default node extent). BottomToTop/RightToLeft stack in reverse.
/// Cross axis: real nodes are placed side by side with nodeSpacing and every
/// rank is centered against the widest one. Virtual nodes take the current
/// cursor without advancing it.
class SimpleCoordinateAssignment : public ICoordinateAssignment {
public:
    SimpleCoordinateAssignment() = default;

    const char* algorithmName() const override { return "RankStack"; }

    void assignCoordinates(LayeredGraph& graph, const LayoutOptions& options) const override;

private:
    std::vector<float> computeRankOffsets(const LayeredGraph& graph,
                                          const LayoutOptions& options) const;
};

}  // namespace algorithms
}  // namespace orthograph
