#pragma once

#include "orthograph/layout/LayeredGraph.h"
#include "orthograph/layout/config/LayoutOptions.h"

namespace orthograph {
namespace algorithms {

/// Gives all real nodes of a rank one height (vertical layouts) or one
/// width (horizontal layouts): the largest found in that rank.
class RankEqualization {
public:
    /// @return Number of nodes whose size changed
    static int equalize(LayeredGraph& graph, Direction direction);
};

}  // namespace algorithms
}  // namespace orthograph
