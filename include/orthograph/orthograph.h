#pragma once

/// @file orthograph.h
/// @brief Main header for the Orthograph diagram layout library
///
/// Orthograph positions the nodes of a directed graph in layers and draws
/// orthogonal, obstacle-avoiding connectors between them.
///
/// Example usage:
/// @code
/// #include <orthograph/orthograph.h>
///
/// orthograph::Diagram diagram;
/// orthograph::SugiyamaLayout layout;
/// auto result = layout.layout(diagram, {{"Start", "Parse", ""}, {"Parse", "Done", "ok"}});
///
/// orthograph::EdgePathOptimizer optimizer;
/// optimizer.optimize(diagram);
/// @endcode

#include <string>

// Core module - Geometry and document model
#include "core/Types.h"
#include "core/GeometryUtils.h"
#include "core/Diagram.h"

// Layout module - Layered layout, routing and cleanup
#include "layout/config/LayoutOptions.h"
#include "layout/config/LayoutResult.h"
#include "layout/SugiyamaLayout.h"
#include "layout/OverlapResolver.h"
#include "layout/EdgeRouter.h"
#include "layout/EdgePathOptimizer.h"
#include "layout/Arrangement.h"
#include "layout/PortDistributor.h"
#include "layout/DiagramPolish.h"
#include "layout/util/LabelMetrics.h"
#include "layout/util/LayoutSerializer.h"

namespace orthograph {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace orthograph
