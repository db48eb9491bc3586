#pragma once

/// @file tracevia.h
/// @brief Main header for the TraceVia edge routing library
///
/// TraceVia computes path geometry for origin-tracing diagrams: nodes are
/// grouped into rectangular clusters (claim, sources, belief drivers,
/// evolution steps) with positions supplied by the caller, and every edge
/// gets SVG path data that avoids cutting through other clusters.
///
/// Example usage:
/// @code
/// #include <tracevia/tracevia.h>
///
/// tracevia::RoutingInput input;
/// input.nodePositions = {{"claim", {50, 0}}, {"src", {350, 0}}};
/// input.clusters = {{"core", 0, 0, 100, 80, {"claim"}},
///                   {"sources", 400, 0, 100, 80, {"src"}}};
/// input.edges = {{"e1", "claim", "src"}};
///
/// tracevia::EdgeRouter router;
/// auto result = router.routeEdges(input);
///
/// tracevia::SvgExport svg;
/// svg.exportToFile(input, result, "diagram.svg");
/// @endcode

// Core module - Geometry and input types
#include "core/Types.h"
#include "core/GeometryUtils.h"
#include "core/TaskExecutor.h"

// Routing module - Edge routing and diagnostics
#include "routing/RoutingOptions.h"
#include "routing/RoutingState.h"
#include "routing/RoutingResult.h"
#include "routing/EdgeRouter.h"
#include "routing/PathIntersection.h"

// Utilities
#include "util/RoutingSerializer.h"

// Export module - Output formats
#include "export/IExporter.h"
#include "export/SvgExport.h"

#include <string>

namespace tracevia {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace tracevia
