#pragma once

#include "../core/Types.h"

#include <vector>

namespace tracevia {

/// Paths already emitted in the current routing pass
///
/// Value type: appended() returns a new state and leaves the receiver
/// untouched. Call it on an rvalue to reuse the storage:
/// @code
/// state = std::move(state).appended(path);
/// @endcode
class RoutingState {
public:
    RoutingState() = default;

    RoutingState appended(const EdgePath& path) const&;
    RoutingState appended(const EdgePath& path) &&;

    const std::vector<EdgePath>& paths() const { return paths_; }
    size_t size() const { return paths_.size(); }
    bool empty() const { return paths_.empty(); }

private:
    explicit RoutingState(std::vector<EdgePath> paths) : paths_(std::move(paths)) {}

    std::vector<EdgePath> paths_;
};

}  // namespace tracevia
