#include "routing/PathSerializer.h"
#include "tracevia/core/GeometryUtils.h"

#include <cmath>

namespace tracevia {

using geometry::formatPoint;

namespace PathSerializer {

std::string toPath(const std::vector<Point>& waypoints) {
    if (waypoints.size() < 2 || waypoints.front() == waypoints.back()) {
        return "";  // nothing to render
    }

    std::string path = "M " + formatPoint(waypoints.front());

    for (size_t i = 1; i < waypoints.size(); ++i) {
        const Point& prev = waypoints[i - 1];
        const Point& curr = waypoints[i];
        float dx = curr.x - prev.x;
        float dy = curr.y - prev.y;

        if (i + 1 == waypoints.size()) {
            // Soft landing on the target
            Point control{prev.x + dx * constants::TERMINAL_CONTROL_RATIO,
                          prev.y + dy * constants::TERMINAL_CONTROL_RATIO};
            path += " C " + formatPoint(control) + " " + formatPoint(curr) + " " + formatPoint(curr);
            continue;
        }

        // Axis-aligned approach, then round into the corner
        Point corner = std::abs(dx) > std::abs(dy) ? Point{curr.x, prev.y}
                                                   : Point{prev.x, curr.y};
        path += " L " + formatPoint(corner) + " Q " + formatPoint(curr) + " " + formatPoint(curr);
    }

    return path;
}

std::string bezierPath(const Point& source, const Point& target, float curvature) {
    if (source == target) {
        return "";
    }
    float dx = target.x - source.x;
    Point cp1{source.x + dx * curvature, source.y};
    Point cp2{target.x - dx * curvature, target.y};

    return "M " + formatPoint(source) + " C " + formatPoint(cp1) + " " +
           formatPoint(cp2) + " " + formatPoint(target);
}

}  // namespace PathSerializer

}  // namespace tracevia
