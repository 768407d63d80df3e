#pragma once

#include "orthograph/layout/LayeredGraph.h"

namespace orthograph {
namespace algorithms {

/// Splits every edge spanning more than one rank into unit-span segments
/// through 1x1 virtual nodes, then builds the rank buckets.
///
/// Chains run in the effective direction, so a reversed edge gets its
/// virtual nodes between target rank and source rank.
class VirtualNodeExpansion {
public:
    /// @return Number of virtual nodes inserted
    static size_t expand(LayeredGraph& graph);
};

}  // namespace algorithms
}  // namespace orthograph
