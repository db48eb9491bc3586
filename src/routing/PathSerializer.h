#pragma once

#include "tracevia/core/Types.h"

#include <string>
#include <vector>

namespace tracevia {

/// Conversion of routes into SVG path data
namespace PathSerializer {

    /// Smooth path through a waypoint sequence
    ///
    /// Starts with "M" at the first waypoint. Every intermediate waypoint is
    /// reached by a line along the dominant axis of its segment followed by a
    /// quadratic into the corner ("L ... Q ..."), which rounds right-angle
    /// turns. The last waypoint is reached by a cubic whose first control
    /// point is the midpoint of the final segment.
    /// @param waypoints Route points in order
    /// @return Path data, or "" for fewer than two waypoints or when the
    ///         route ends where it starts
    std::string toPath(const std::vector<Point>& waypoints);

    /// Single cubic Bézier between two points with horizontal tangents
    /// @param curvature Control point distance as a fraction of dx
    /// @return "M sx,sy C c1 c2 tx,ty", or "" when source == target
    std::string bezierPath(const Point& source, const Point& target, float curvature);

}  // namespace PathSerializer

}  // namespace tracevia
