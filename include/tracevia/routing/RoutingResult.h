#pragma once

#include "../core/Types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace tracevia {

/// Why an edge produced no path
enum class DropReason {
    MissingSource,  ///< No position for the source node
    MissingTarget,  ///< No position for the target node
    MissingBoth
};

const char* dropReasonToString(DropReason reason);

struct DroppedEdge {
    EdgeId edgeId;
    DropReason reason = DropReason::MissingBoth;
};

/// A node listed by more than one cluster, and how it was resolved
struct MembershipConflict {
    NodeId nodeId;
    ClusterId keptClusterId;
    ClusterId ignoredClusterId;
};

/// Output of one routing pass
///
/// Every input edge ends up either in edgePaths or in droppedEdges, so
/// callers can check completeness without diffing ids themselves.
class RoutingResult {
public:
    RoutingResult() = default;

    /// Store a routed edge (replaces an earlier path with the same id)
    void setEdgePath(const EdgePath& path);
    const EdgePath* getEdgePath(const EdgeId& id) const;
    bool hasEdgePath(const EdgeId& id) const;

    const std::unordered_map<EdgeId, EdgePath>& edgePaths() const { return edgePaths_; }

    /// Edge ids in the order they were routed (first occurrence only)
    const std::vector<EdgeId>& routingOrder() const { return routingOrder_; }

    void addDroppedEdge(const EdgeId& id, DropReason reason);
    const std::vector<DroppedEdge>& droppedEdges() const { return droppedEdges_; }
    bool wasDropped(const EdgeId& id) const;

    void setMembershipConflicts(std::vector<MembershipConflict> conflicts);
    const std::vector<MembershipConflict>& membershipConflicts() const { return membershipConflicts_; }

    size_t edgeCount() const { return edgePaths_.size(); }

    /// True when no edge was dropped
    bool isComplete() const { return droppedEdges_.empty(); }

    void clear();

private:
    std::unordered_map<EdgeId, EdgePath> edgePaths_;
    std::vector<EdgeId> routingOrder_;
    std::vector<DroppedEdge> droppedEdges_;
    std::vector<MembershipConflict> membershipConflicts_;
};

}  // namespace tracevia
