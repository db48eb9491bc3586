#pragma once

#include "tracevia/core/GeometryUtils.h"
#include "tracevia/routing/RoutingState.h"

namespace tracevia {

/// Separation of parallel cross-cluster edges
///
/// A previously routed path is parallel to a new edge when its first
/// waypoint is within `threshold` of the new source and its last waypoint
/// is within `threshold` of the new target. Each parallel predecessor
/// pushes the new edge one `increment` further down.
///
/// The result depends on which paths are already in the state, so edges
/// must be routed in a stable order for reproducible output.
class OffsetResolver {
public:
    OffsetResolver() = default;
    OffsetResolver(float threshold, float increment);

    /// Offset for a new edge
    /// @param edgeId Edge being routed (for diagnostics)
    /// @param state Paths emitted so far in this pass
    /// @return increment * number of parallel predecessors
    float computeOffset(const EdgeId& edgeId, const RoutingState& state,
                        const Point& source, const Point& target) const;

    /// Check a single predecessor
    bool isParallel(const EdgePath& existing, const Point& source, const Point& target) const;

    float threshold() const { return threshold_; }
    float increment() const { return increment_; }

private:
    float threshold_ = constants::PARALLEL_THRESHOLD;
    float increment_ = constants::OFFSET_INCREMENT;
};

}  // namespace tracevia
