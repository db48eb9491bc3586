#pragma once

#include "Types.h"

#include <string>

namespace tracevia {

/// Geometry helpers shared by the routing components
namespace geometry {

/// 2D cross product (z component of a × b)
constexpr float cross(const Point& a, const Point& b) {
    return a.x * b.y - a.y * b.x;
}

/// Check if two line segments cross in their interiors
///
/// Parametric test: with det = (a2 - a1) × (b2 - b1), segments intersect
/// iff det != 0 and both line parameters lie strictly inside (0, 1).
/// Touching at an endpoint and collinear overlap do not count.
/// @param a1 Start point of first segment
/// @param a2 End point of first segment
/// @param b1 Start point of second segment
/// @param b2 End point of second segment
bool segmentsIntersect(const Point& a1, const Point& a2,
                       const Point& b1, const Point& b2);

/// Check if two points are closer than threshold (strict)
bool withinDistance(const Point& a, const Point& b, float threshold);

/// Format a coordinate for SVG path data
///
/// Shortest decimal form that round-trips (50, 170.5, 0.1), with
/// negative zero written as 0.
std::string formatCoordinate(float value);

/// Format a point as "x,y"
std::string formatPoint(const Point& p);

}  // namespace geometry

/// Routing constants
namespace constants {

/// Horizontal gap between a cluster boundary and the exit/entry column
constexpr float CLUSTER_CLEARANCE = 40.0f;

/// Endpoint distance below which two edges count as parallel
constexpr float PARALLEL_THRESHOLD = 100.0f;

/// Vertical shift applied per parallel predecessor
constexpr float OFFSET_INCREMENT = 25.0f;

/// Control-point distance as a fraction of dx for same-cluster curves
constexpr float SMOOTH_CURVATURE = 0.4f;
constexpr float TIGHT_CURVATURE = 0.25f;

/// Position of the terminal curve control point along the last segment
constexpr float TERMINAL_CONTROL_RATIO = 0.5f;

}  // namespace constants

}  // namespace tracevia
