#include "tracevia/core/GeometryUtils.h"

#include <cmath>
#include <format>

namespace tracevia::geometry {

bool segmentsIntersect(const Point& a1, const Point& a2,
                       const Point& b1, const Point& b2) {
    float det = cross(a2 - a1, b2 - b1);
    if (det == 0.0f) {
        return false;  // Parallel or collinear
    }

    float lambda = ((b2.y - b1.y) * (b2.x - a1.x) + (b1.x - b2.x) * (b2.y - a1.y)) / det;
    float gamma = ((a1.y - a2.y) * (b2.x - a1.x) + (a2.x - a1.x) * (b2.y - a1.y)) / det;

    return (0.0f < lambda && lambda < 1.0f) && (0.0f < gamma && gamma < 1.0f);
}

bool withinDistance(const Point& a, const Point& b, float threshold) {
    return a.distanceTo(b) < threshold;
}

std::string formatCoordinate(float value) {
    if (value == 0.0f) {
        return "0";
    }
    return std::format("{}", value);
}

std::string formatPoint(const Point& p) {
    return formatCoordinate(p.x) + "," + formatCoordinate(p.y);
}

}  // namespace tracevia::geometry
