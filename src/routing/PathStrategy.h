#pragma once

#include "tracevia/core/Types.h"
#include "tracevia/routing/RoutingOptions.h"

#include <string>
#include <vector>

namespace tracevia {

/// Geometry chosen for one edge
struct RoutedPath {
    std::string path;
    std::vector<Point> waypoints;
};

/// Which routing an edge gets
enum class RouteKind {
    Bezier,      ///< Same cluster (or unclustered endpoint)
    Orthogonal   ///< Leaves and enters clusters horizontally
};

/// Selects and computes the route of a single edge
///
/// Same-cluster edges get one cubic Bézier and the bare endpoints as
/// waypoints; the curve lives only in the path string. Cross-cluster
/// edges get an explicit waypoint chain that exits the source cluster to
/// the right, travels at its own vertical level (shifted by the parallel
/// offset) and enters the target cluster from the left.
class PathStrategy {
public:
    PathStrategy() = default;
    explicit PathStrategy(const RoutingOptions& options);

    static RouteKind classify(const Cluster* sourceCluster, const Cluster* targetCluster);

    /// Route an edge using the strategy its clusters call for
    /// Coincident endpoints give {source, target} and an empty path.
    /// @param offset Vertical shift of the travel level (ignored for Bézier)
    RoutedPath route(const Point& source, const Point& target,
                     const Cluster* sourceCluster, const Cluster* targetCluster,
                     float offset = 0.0f) const;

    /// Same-cluster curve, waypoints are exactly {source, target}
    RoutedPath bezierRoute(const Point& source, const Point& target) const;

    /// Cross-cluster waypoint chain
    ///
    /// source -> (exitX, source.y + offset) -> (midX, level) ->
    /// (midX, target.y + offset) -> (enterX, target.y + offset) -> target,
    /// where exitX/enterX sit clusterClearance outside the cluster's right
    /// and left sides. A missing cluster skips its part of the chain.
    RoutedPath orthogonalRoute(const Point& source, const Point& target,
                               const Cluster* sourceCluster, const Cluster* targetCluster,
                               float offset) const;

    const RoutingOptions& options() const { return options_; }

private:
    RoutingOptions options_;
};

}  // namespace tracevia
