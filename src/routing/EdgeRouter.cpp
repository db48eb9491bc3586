#include "tracevia/routing/EdgeRouter.h"
#include "tracevia/common/Logger.h"
#include "routing/ClusterIndex.h"
#include "routing/OffsetResolver.h"
#include "routing/PathStrategy.h"

#include <future>

namespace tracevia {

namespace {
    const Point* findPosition(const std::unordered_map<NodeId, Point>& positions, const NodeId& id) {
        auto it = positions.find(id);
        return it != positions.end() ? &it->second : nullptr;
    }
}  // anonymous namespace

EdgeRouter::EdgeRouter(const RoutingOptions& options)
    : options_(options) {}

RoutingResult EdgeRouter::routeEdges(const RoutingInput& input) const {
    return routeEdges(input.edges, input.nodePositions, input.clusters);
}

RoutingResult EdgeRouter::routeEdges(
    const std::vector<Edge>& edges,
    const std::unordered_map<NodeId, Point>& nodePositions,
    const std::vector<Cluster>& clusters) const {

    RoutingResult result;
    ClusterIndex index = ClusterIndex::build(clusters, options_.membershipPolicy);
    result.setMembershipConflicts(index.conflicts());

    RoutingState state;
    for (const auto& edge : edges) {
        const Point* source = findPosition(nodePositions, edge.source);
        const Point* target = findPosition(nodePositions, edge.target);

        if (!source || !target) {
            DropReason reason = !source && !target ? DropReason::MissingBoth
                              : !source            ? DropReason::MissingSource
                                                   : DropReason::MissingTarget;
            LOG_WARN("Dropping edge '{}' ({} -> {}): {}",
                     edge.id, edge.source, edge.target, dropReasonToString(reason));
            result.addDroppedEdge(edge.id, reason);
            continue;
        }

        Step step = routeEdge(edge, *source, *target,
                              index.find(edge.source), index.find(edge.target),
                              std::move(state));
        result.setEdgePath(step.path);
        state = std::move(step.state);
    }

    LOG_DEBUG("Routed {} of {} edges ({} dropped, {} membership conflicts)",
              result.edgeCount(), edges.size(),
              result.droppedEdges().size(), result.membershipConflicts().size());
    return result;
}

EdgeRouter::Step EdgeRouter::routeEdge(const Edge& edge,
                                       const Point& source, const Point& target,
                                       const Cluster* sourceCluster, const Cluster* targetCluster,
                                       RoutingState state) const {
    PathStrategy strategy(options_);

    float offset = 0.0f;
    if (PathStrategy::classify(sourceCluster, targetCluster) == RouteKind::Orthogonal) {
        OffsetResolver resolver(options_.parallelThreshold, options_.offsetIncrement);
        offset = resolver.computeOffset(edge.id, state, source, target);
    }

    RoutedPath routed = strategy.route(source, target, sourceCluster, targetCluster, offset);
    if (routed.path.empty()) {
        LOG_DEBUG("Edge '{}' is degenerate, nothing to render", edge.id);
    }

    EdgePath path{edge.id, std::move(routed.path), std::move(routed.waypoints)};
    RoutingState next = std::move(state).appended(path);
    return Step{std::move(path), std::move(next)};
}

std::vector<RoutingResult> EdgeRouter::routeDiagrams(
    const std::vector<RoutingInput>& inputs,
    ITaskExecutor& executor) const {

    std::vector<RoutingResult> results;
    results.reserve(inputs.size());

    if (!executor.isRunning()) {
        LOG_WARN("Executor not running, routing {} diagrams on the calling thread", inputs.size());
        for (const auto& input : inputs) {
            results.push_back(routeEdges(input));
        }
        return results;
    }

    std::vector<std::future<RoutingResult>> futures;
    futures.reserve(inputs.size());

    for (const auto& input : inputs) {
        auto promise = std::make_shared<std::promise<RoutingResult>>();
        futures.push_back(promise->get_future());

        bool accepted = executor.submit([this, &input, promise]() {
            try {
                promise->set_value(routeEdges(input));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        // Executor stopped after the check above
        if (!accepted) {
            LOG_WARN("Executor rejected diagram {}, routing it on the calling thread",
                     futures.size() - 1);
            promise->set_value(routeEdges(input));
        }
    }

    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace tracevia
