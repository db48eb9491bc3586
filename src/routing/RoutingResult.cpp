#include "tracevia/routing/RoutingResult.h"

#include <algorithm>

namespace tracevia {

const char* dropReasonToString(DropReason reason) {
    switch (reason) {
        case DropReason::MissingSource: return "missing_source";
        case DropReason::MissingTarget: return "missing_target";
        case DropReason::MissingBoth: return "missing_both";
    }
    return "missing_both";
}

void RoutingResult::setEdgePath(const EdgePath& path) {
    auto [it, inserted] = edgePaths_.insert_or_assign(path.id, path);
    if (inserted) {
        routingOrder_.push_back(path.id);
    }
}

const EdgePath* RoutingResult::getEdgePath(const EdgeId& id) const {
    auto it = edgePaths_.find(id);
    return it != edgePaths_.end() ? &it->second : nullptr;
}

bool RoutingResult::hasEdgePath(const EdgeId& id) const {
    return edgePaths_.count(id) > 0;
}

void RoutingResult::addDroppedEdge(const EdgeId& id, DropReason reason) {
    droppedEdges_.push_back({id, reason});
}

bool RoutingResult::wasDropped(const EdgeId& id) const {
    return std::any_of(droppedEdges_.begin(), droppedEdges_.end(),
                       [&id](const DroppedEdge& d) { return d.edgeId == id; });
}

void RoutingResult::setMembershipConflicts(std::vector<MembershipConflict> conflicts) {
    membershipConflicts_ = std::move(conflicts);
}

void RoutingResult::clear() {
    edgePaths_.clear();
    routingOrder_.clear();
    droppedEdges_.clear();
    membershipConflicts_.clear();
}

}  // namespace tracevia
