#include "routing/OffsetResolver.h"
#include "tracevia/common/Logger.h"

#include <algorithm>

namespace tracevia {

OffsetResolver::OffsetResolver(float threshold, float increment)
    : threshold_(threshold), increment_(increment) {}

bool OffsetResolver::isParallel(const EdgePath& existing, const Point& source, const Point& target) const {
    if (existing.waypoints.size() < 2) {
        return false;
    }
    return geometry::withinDistance(existing.waypoints.front(), source, threshold_) &&
           geometry::withinDistance(existing.waypoints.back(), target, threshold_);
}

float OffsetResolver::computeOffset(const EdgeId& edgeId, const RoutingState& state,
                                    const Point& source, const Point& target) const {
    const auto& paths = state.paths();
    auto parallelCount = std::count_if(paths.begin(), paths.end(),
        [&](const EdgePath& existing) { return isParallel(existing, source, target); });

    if (parallelCount > 0) {
        LOG_TRACE("Edge '{}' parallel to {} routed edge(s)", edgeId, parallelCount);
    }
    return increment_ * static_cast<float>(parallelCount);
}

}  // namespace tracevia
