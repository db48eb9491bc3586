#include "tracevia/routing/PathIntersection.h"
#include "tracevia/core/GeometryUtils.h"

#include <algorithm>

namespace tracevia {

namespace PathIntersection {

namespace {
    /// Axis-aligned bounds of a waypoint list
    struct Bounds {
        float minX = 0.0f;
        float minY = 0.0f;
        float maxX = 0.0f;
        float maxY = 0.0f;

        bool overlaps(const Bounds& o) const {
            return minX <= o.maxX && o.minX <= maxX && minY <= o.maxY && o.minY <= maxY;
        }
    };

    Bounds computeBounds(const EdgePath& path) {
        Bounds b;
        if (path.waypoints.empty()) {
            return b;
        }
        b.minX = b.maxX = path.waypoints.front().x;
        b.minY = b.maxY = path.waypoints.front().y;
        for (const auto& p : path.waypoints) {
            b.minX = std::min(b.minX, p.x);
            b.maxX = std::max(b.maxX, p.x);
            b.minY = std::min(b.minY, p.y);
            b.maxY = std::max(b.maxY, p.y);
        }
        return b;
    }
}  // anonymous namespace

bool segmentsIntersect(const Point& a1, const Point& a2,
                       const Point& b1, const Point& b2) {
    return geometry::segmentsIntersect(a1, a2, b1, b2);
}

bool intersects(const EdgePath& a, const EdgePath& b) {
    for (size_t i = 0; i + 1 < a.waypoints.size(); ++i) {
        for (size_t j = 0; j + 1 < b.waypoints.size(); ++j) {
            if (segmentsIntersect(a.waypoints[i], a.waypoints[i + 1],
                                  b.waypoints[j], b.waypoints[j + 1])) {
                return true;
            }
        }
    }
    return false;
}

int countIntersections(const EdgePath& a, const EdgePath& b) {
    int count = 0;
    a.forEachSegment([&](const Point& a1, const Point& a2) {
        b.forEachSegment([&](const Point& b1, const Point& b2) {
            if (segmentsIntersect(a1, a2, b1, b2)) {
                ++count;
            }
        });
    });
    return count;
}

std::vector<std::pair<EdgeId, EdgeId>> findIntersectingPairs(const RoutingResult& result) {
    std::vector<std::pair<EdgeId, EdgeId>> pairs;

    const auto& order = result.routingOrder();
    std::vector<const EdgePath*> paths;
    std::vector<Bounds> bounds;
    paths.reserve(order.size());
    bounds.reserve(order.size());

    for (const auto& id : order) {
        const EdgePath* path = result.getEdgePath(id);
        if (path) {
            paths.push_back(path);
            bounds.push_back(computeBounds(*path));
        }
    }

    // O(n²) with bounding box rejection
    for (size_t i = 0; i < paths.size(); ++i) {
        for (size_t j = i + 1; j < paths.size(); ++j) {
            if (!bounds[i].overlaps(bounds[j])) {
                continue;
            }
            if (intersects(*paths[i], *paths[j])) {
                pairs.emplace_back(paths[i]->id, paths[j]->id);
            }
        }
    }

    return pairs;
}

int countAllIntersections(const RoutingResult& result) {
    int total = 0;
    const auto& order = result.routingOrder();
    for (size_t i = 0; i < order.size(); ++i) {
        const EdgePath* a = result.getEdgePath(order[i]);
        for (size_t j = i + 1; j < order.size(); ++j) {
            const EdgePath* b = result.getEdgePath(order[j]);
            if (a && b) {
                total += countIntersections(*a, *b);
            }
        }
    }
    return total;
}

}  // namespace PathIntersection

}  // namespace tracevia
