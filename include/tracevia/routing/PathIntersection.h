#pragma once

#include "../core/Types.h"
#include "RoutingResult.h"

#include <utility>
#include <vector>

namespace tracevia {

/// Crossing detection between routed edges
///
/// Works on waypoints, not on the smoothed curves, and only reports
/// proper crossings: segments that merely touch at an endpoint or run
/// along the same line are not intersections. Used for diagnostics; the
/// router does not reroute based on it.
namespace PathIntersection {

    /// Check if two segments cross (see geometry::segmentsIntersect)
    bool segmentsIntersect(const Point& a1, const Point& a2,
                           const Point& b1, const Point& b2);

    /// Check if any segment of one path crosses any segment of the other
    /// Symmetric: intersects(a, b) == intersects(b, a)
    bool intersects(const EdgePath& a, const EdgePath& b);

    /// Number of crossing segment pairs between two paths
    int countIntersections(const EdgePath& a, const EdgePath& b);

    /// All crossing edge pairs of a routing pass
    /// Pairs are listed in routing order, first id routed before second.
    std::vector<std::pair<EdgeId, EdgeId>> findIntersectingPairs(const RoutingResult& result);

    /// Total number of crossing segment pairs over all edge pairs
    int countAllIntersections(const RoutingResult& result);

}  // namespace PathIntersection

}  // namespace tracevia
