#include "routing/ClusterIndex.h"
#include "tracevia/common/Logger.h"

namespace tracevia {

ClusterIndex ClusterIndex::build(const std::vector<Cluster>& clusters,
                                 ClusterMembershipPolicy policy) {
    ClusterIndex index;
    index.clusters_ = clusters;

    for (size_t ci = 0; ci < index.clusters_.size(); ++ci) {
        const Cluster& cluster = index.clusters_[ci];

        for (const auto& nodeId : cluster.nodeIds) {
            auto [it, inserted] = index.owner_.try_emplace(nodeId, ci);
            if (inserted) {
                continue;
            }

            if (it->second == ci) {
                continue;  // Listed twice by the same cluster
            }
            const Cluster& previous = index.clusters_[it->second];

            MembershipConflict conflict;
            conflict.nodeId = nodeId;
            if (policy == ClusterMembershipPolicy::LastWins) {
                conflict.keptClusterId = cluster.id;
                conflict.ignoredClusterId = previous.id;
                it->second = ci;
            } else {
                conflict.keptClusterId = previous.id;
                conflict.ignoredClusterId = cluster.id;
            }

            LOG_WARN("Node '{}' listed in clusters '{}' and '{}', keeping '{}'",
                     nodeId, previous.id, cluster.id, conflict.keptClusterId);
            index.conflicts_.push_back(std::move(conflict));
        }
    }

    LOG_DEBUG("Indexed {} nodes in {} clusters ({} conflicts)",
              index.owner_.size(), index.clusters_.size(), index.conflicts_.size());
    return index;
}

const Cluster* ClusterIndex::find(const NodeId& nodeId) const {
    auto it = owner_.find(nodeId);
    return it != owner_.end() ? &clusters_[it->second] : nullptr;
}

bool ClusterIndex::sameCluster(const Cluster* source, const Cluster* target) {
    if (!source || !target) {
        return true;
    }
    return source->id == target->id;
}

}  // namespace tracevia
