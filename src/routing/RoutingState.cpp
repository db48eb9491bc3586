#include "tracevia/routing/RoutingState.h"

namespace tracevia {

RoutingState RoutingState::appended(const EdgePath& path) const& {
    std::vector<EdgePath> paths = paths_;
    paths.push_back(path);
    return RoutingState(std::move(paths));
}

RoutingState RoutingState::appended(const EdgePath& path) && {
    paths_.push_back(path);
    return RoutingState(std::move(paths_));
}

}  // namespace tracevia
