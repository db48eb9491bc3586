#pragma once

#include "../core/TaskExecutor.h"
#include "../core/Types.h"
#include "RoutingOptions.h"
#include "RoutingResult.h"
#include "RoutingState.h"

#include <unordered_map>
#include <vector>

namespace tracevia {

/// Computes edge geometry for one origin-tracing diagram
///
/// A pass walks the edges in input order:
/// 1. resolve source/target clusters
/// 2. same cluster (or unclustered endpoint): cubic Bézier;
///    otherwise an orthogonal chain offset against parallel predecessors
/// 3. serialize to SVG path data
/// 4. append the path to the routing state seen by later edges
///
/// Edges whose endpoints have no position are reported in
/// RoutingResult::droppedEdges instead of being routed.
///
/// The router holds only options; passes share no state and may run
/// concurrently.
///
/// @code
/// tracevia::EdgeRouter router;
/// auto result = router.routeEdges(input);
/// for (const auto& id : result.routingOrder()) {
///     draw(result.getEdgePath(id)->path);
/// }
/// @endcode
class EdgeRouter {
public:
    /// Output of a single fold step
    struct Step {
        EdgePath path;
        RoutingState state;  ///< Input state with path appended
    };

    EdgeRouter() = default;
    explicit EdgeRouter(const RoutingOptions& options);

    /// Route all edges of one diagram
    RoutingResult routeEdges(const RoutingInput& input) const;

    RoutingResult routeEdges(
        const std::vector<Edge>& edges,
        const std::unordered_map<NodeId, Point>& nodePositions,
        const std::vector<Cluster>& clusters) const;

    /// Route a single edge against the paths emitted so far
    /// @param sourceCluster Owning cluster of the source, nullptr if none
    /// @param targetCluster Owning cluster of the target, nullptr if none
    /// @param state Paths emitted earlier in this pass
    /// @return The new path and the state to use for the next edge
    Step routeEdge(const Edge& edge,
                   const Point& source, const Point& target,
                   const Cluster* sourceCluster, const Cluster* targetCluster,
                   RoutingState state) const;

    /// Route independent diagrams on an executor
    /// Results come back in input order. Diagrams the executor does not
    /// accept (not running, or stopped mid-batch) are routed on the
    /// calling thread.
    std::vector<RoutingResult> routeDiagrams(
        const std::vector<RoutingInput>& inputs,
        ITaskExecutor& executor) const;

    const RoutingOptions& options() const { return options_; }
    void setOptions(const RoutingOptions& options) { options_ = options; }

private:
    RoutingOptions options_;
};

}  // namespace tracevia
