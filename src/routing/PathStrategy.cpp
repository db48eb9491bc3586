#include "routing/PathStrategy.h"
#include "routing/ClusterIndex.h"
#include "routing/PathSerializer.h"

namespace tracevia {

PathStrategy::PathStrategy(const RoutingOptions& options)
    : options_(options) {}

RouteKind PathStrategy::classify(const Cluster* sourceCluster, const Cluster* targetCluster) {
    return ClusterIndex::sameCluster(sourceCluster, targetCluster) ? RouteKind::Bezier
                                                                   : RouteKind::Orthogonal;
}

RoutedPath PathStrategy::route(const Point& source, const Point& target,
                               const Cluster* sourceCluster, const Cluster* targetCluster,
                               float offset) const {
    if (source == target) {
        return bezierRoute(source, target);  // nothing to draw
    }
    if (classify(sourceCluster, targetCluster) == RouteKind::Bezier) {
        return bezierRoute(source, target);
    }
    return orthogonalRoute(source, target, sourceCluster, targetCluster, offset);
}

RoutedPath PathStrategy::bezierRoute(const Point& source, const Point& target) const {
    RoutedPath result;
    result.waypoints = {source, target};
    result.path = PathSerializer::bezierPath(source, target, options_.curvature());
    return result;
}

RoutedPath PathStrategy::orthogonalRoute(const Point& source, const Point& target,
                                         const Cluster* sourceCluster, const Cluster* targetCluster,
                                         float offset) const {
    RoutedPath result;
    result.waypoints.push_back(source);

    Point current = source;

    if (sourceCluster) {
        float exitX = sourceCluster->right() + options_.clusterClearance;
        current = {exitX, source.y + offset};
        result.waypoints.push_back(current);
    }

    if (targetCluster) {
        float enterX = targetCluster->left() - options_.clusterClearance;
        float levelY = target.y + offset;
        float midX = (current.x + enterX) / 2;

        result.waypoints.push_back({midX, current.y});
        result.waypoints.push_back({midX, levelY});
        result.waypoints.push_back({enterX, levelY});
    }

    result.waypoints.push_back(target);

    result.path = PathSerializer::toPath(result.waypoints);
    return result;
}

}  // namespace tracevia
