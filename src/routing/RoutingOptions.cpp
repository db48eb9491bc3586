#include "tracevia/routing/RoutingOptions.h"

namespace tracevia {

RoutingOptions RoutingOptions::standard() {
    return RoutingOptions{};
}

RoutingOptions RoutingOptions::compact() {
    RoutingOptions options;
    options.curveStyle = CurveStyle::Tight;
    options.clusterClearance = 20.0f;
    options.parallelThreshold = 60.0f;
    options.offsetIncrement = 15.0f;
    return options;
}

}  // namespace tracevia
