#pragma once

#include "../core/GeometryUtils.h"

namespace tracevia {

/// Shape of same-cluster curves
enum class CurveStyle {
    Smooth,  ///< Control points at 0.4 * dx
    Tight    ///< Control points at 0.25 * dx
};

/// Tie-break when a node is listed in more than one cluster
enum class ClusterMembershipPolicy {
    LastWins,   ///< Later cluster in input order owns the node
    FirstWins   ///< First registered cluster owns the node
};

/// Configuration for one routing pass
///
/// Presets:
/// - standard(): values the origin-tracing diagram is tuned for
/// - compact(): tighter curves and narrower channels for dense diagrams
///
/// @code
/// auto options = RoutingOptions::standard()
///     .withMembershipPolicy(ClusterMembershipPolicy::FirstWins);
/// EdgeRouter router(options);
/// @endcode
struct RoutingOptions {
    CurveStyle curveStyle = CurveStyle::Smooth;

    /// Gap between cluster boundary and the exit/entry column (pixels)
    float clusterClearance = constants::CLUSTER_CLEARANCE;

    /// Endpoint distance below which a routed edge counts as parallel (pixels)
    float parallelThreshold = constants::PARALLEL_THRESHOLD;

    /// Vertical shift per parallel predecessor (pixels)
    float offsetIncrement = constants::OFFSET_INCREMENT;

    ClusterMembershipPolicy membershipPolicy = ClusterMembershipPolicy::LastWins;

    // === Named Presets ===

    static RoutingOptions standard();
    static RoutingOptions compact();

    // === Convenience Methods ===

    RoutingOptions& withCurveStyle(CurveStyle style) {
        curveStyle = style;
        return *this;
    }

    RoutingOptions& withClusterClearance(float clearance) {
        clusterClearance = clearance;
        return *this;
    }

    RoutingOptions& withParallelThreshold(float threshold) {
        parallelThreshold = threshold;
        return *this;
    }

    RoutingOptions& withOffsetIncrement(float increment) {
        offsetIncrement = increment;
        return *this;
    }

    RoutingOptions& withMembershipPolicy(ClusterMembershipPolicy policy) {
        membershipPolicy = policy;
        return *this;
    }

    /// Curvature factor for the configured curve style
    float curvature() const {
        return curveStyle == CurveStyle::Tight ? constants::TIGHT_CURVATURE
                                               : constants::SMOOTH_CURVATURE;
    }
};

}  // namespace tracevia
