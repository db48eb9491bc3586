#pragma once

#include "tracevia/core/Types.h"
#include "tracevia/routing/RoutingOptions.h"
#include "tracevia/routing/RoutingResult.h"

#include <unordered_map>
#include <vector>

namespace tracevia {

/// Lookup from node id to the cluster that owns it
///
/// The index keeps its own copy of the clusters, so pointers returned by
/// find() stay valid for the lifetime of the index regardless of what
/// happens to the input vector.
///
/// A node listed by several clusters is resolved by the membership
/// policy; every such collision is kept in conflicts() and logged.
class ClusterIndex {
public:
    ClusterIndex() = default;

    static ClusterIndex build(
        const std::vector<Cluster>& clusters,
        ClusterMembershipPolicy policy = ClusterMembershipPolicy::LastWins);

    /// Owning cluster of a node, nullptr if the node is in no cluster
    const Cluster* find(const NodeId& nodeId) const;

    bool contains(const NodeId& nodeId) const { return find(nodeId) != nullptr; }

    const std::vector<MembershipConflict>& conflicts() const { return conflicts_; }
    const std::vector<Cluster>& clusters() const { return clusters_; }
    size_t nodeCount() const { return owner_.size(); }

    /// True if both endpoints route as one cluster (Bézier strategy)
    ///
    /// An endpoint without a cluster counts as same-cluster.
    static bool sameCluster(const Cluster* source, const Cluster* target);

private:
    std::vector<Cluster> clusters_;
    std::unordered_map<NodeId, size_t> owner_;  ///< node -> index into clusters_
    std::vector<MembershipConflict> conflicts_;
};

}  // namespace tracevia
