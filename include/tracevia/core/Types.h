#pragma once

#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracevia {

using NodeId = std::string;
using EdgeId = std::string;
using ClusterId = std::string;

/// Point in diagram space
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }

    float length() const { return std::hypot(x, y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Rectangular group of semantically related nodes
///
/// Position is given by the center, extent by width/height.
/// Used only to decide the routing style and the exit/entry columns
/// of cross-cluster edges.
struct Cluster {
    ClusterId id;
    float centerX = 0.0f;
    float centerY = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    std::vector<NodeId> nodeIds;

    float left() const { return centerX - width / 2; }
    float right() const { return centerX + width / 2; }
    float top() const { return centerY - height / 2; }
    float bottom() const { return centerY + height / 2; }
};

/// Directed connection between two nodes (read-only input)
struct Edge {
    EdgeId id;
    NodeId source;
    NodeId target;
};

/// Routed geometry of one edge
struct EdgePath {
    EdgeId id;
    std::string path;              ///< SVG path data (M, C, L, Q commands)
    std::vector<Point> waypoints;  ///< Route before smoothing

    /// Iterate over consecutive waypoint pairs
    template<typename Func>
    void forEachSegment(Func&& callback) const {
        for (size_t i = 0; i + 1 < waypoints.size(); ++i) {
            callback(waypoints[i], waypoints[i + 1]);
        }
    }

    size_t segmentCount() const {
        return waypoints.size() < 2 ? 0 : waypoints.size() - 1;
    }

    bool empty() const { return path.empty(); }
};

/// Everything one routing pass needs from the upstream layout phase
struct RoutingInput {
    std::unordered_map<NodeId, Point> nodePositions;
    std::vector<Cluster> clusters;
    std::vector<Edge> edges;
};

}  // namespace tracevia
