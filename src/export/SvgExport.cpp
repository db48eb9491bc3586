#include "tracevia/export/SvgExport.h"
#include "tracevia/common/Logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace tracevia {

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::exportToString(const RoutingInput& input, const RoutingResult& result) {
    std::ostringstream out;
    exportToStream(input, result, out);
    return out.str();
}

void SvgExport::exportToStream(const RoutingInput& input, const RoutingResult& result, std::ostream& out) {
    Bounds bounds = computeBounds(input, result);

    writeHeader(out, bounds);
    writeStyles(out);
    writeMarkers(out);

    for (const auto& cluster : input.clusters) {
        writeCluster(out, cluster);
    }

    // Edges in routing order so overlapping strokes stack the same way every time
    for (const auto& id : result.routingOrder()) {
        const EdgePath* path = result.getEdgePath(id);
        if (path) {
            writeEdge(out, *path);
        }
    }

    // Nodes last, sorted for stable output
    std::vector<const std::pair<const NodeId, Point>*> nodes;
    nodes.reserve(input.nodePositions.size());
    for (const auto& entry : input.nodePositions) {
        nodes.push_back(&entry);
    }
    std::sort(nodes.begin(), nodes.end(),
              [](const auto* a, const auto* b) { return a->first < b->first; });
    for (const auto* entry : nodes) {
        writeNode(out, entry->first, entry->second);
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const RoutingInput& input, const RoutingResult& result, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Cannot write SVG '{}'", filename);
        return false;
    }
    exportToStream(input, result, file);
    return file.good();
}

SvgExport::Bounds SvgExport::computeBounds(const RoutingInput& input, const RoutingResult& result) const {
    bool any = false;
    float minX = 0.0f, minY = 0.0f, maxX = 0.0f, maxY = 0.0f;

    auto include = [&](float x, float y) {
        if (!any) {
            minX = maxX = x;
            minY = maxY = y;
            any = true;
            return;
        }
        minX = std::min(minX, x);
        maxX = std::max(maxX, x);
        minY = std::min(minY, y);
        maxY = std::max(maxY, y);
    };

    for (const auto& cluster : input.clusters) {
        include(cluster.left(), cluster.top());
        include(cluster.right(), cluster.bottom());
    }
    for (const auto& [id, pos] : input.nodePositions) {
        include(pos.x, pos.y);
    }
    for (const auto& [id, path] : result.edgePaths()) {
        for (const auto& p : path.waypoints) {
            include(p.x, p.y);
        }
    }

    Bounds bounds;
    bounds.x = minX - options_.padding;
    bounds.y = minY - options_.padding;
    bounds.width = (maxX - minX) + 2 * options_.padding;
    bounds.height = (maxY - minY) + 2 * options_.padding;
    return bounds;
}

void SvgExport::writeHeader(std::ostream& out, const Bounds& bounds) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << bounds.width << "\" "
        << "height=\"" << bounds.height << "\" "
        << "viewBox=\"" << bounds.x << " " << bounds.y << " "
        << bounds.width << " " << bounds.height << "\">\n";

    out << "  <rect x=\"" << bounds.x << "\" y=\"" << bounds.y << "\" "
        << "width=\"" << bounds.width << "\" height=\"" << bounds.height << "\" "
        << "fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    out << "  <style>\n";
    out << "    .cluster { fill: " << options_.clusterFill << "; "
        << "stroke: " << options_.clusterStroke << "; "
        << "stroke-width: " << options_.clusterStrokeWidth << "; "
        << "stroke-dasharray: " << options_.clusterStrokeDasharray << "; }\n";
    out << "    .node { fill: " << options_.nodeFill << "; }\n";
    out << "    .edge { fill: none; "
        << "stroke: " << options_.edgeStroke << "; "
        << "stroke-width: " << options_.edgeStrokeWidth << "; }\n";
    out << "    .waypoint { fill: " << options_.edgeStroke << "; }\n";
    out << "    .label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.fontSize << "px; "
        << "text-anchor: middle; }\n";
    out << "  </style>\n";
}

void SvgExport::writeMarkers(std::ostream& out) {
    out << "  <defs>\n";
    out << "    <marker id=\"arrowhead\" markerWidth=\"10\" markerHeight=\"7\" "
        << "refX=\"9\" refY=\"3.5\" orient=\"auto\">\n";
    out << "      <polygon points=\"0 0, 10 3.5, 0 7\" fill=\""
        << options_.edgeStroke << "\"/>\n";
    out << "    </marker>\n";
    out << "  </defs>\n";
}

void SvgExport::writeFooter(std::ostream& out) {
    out << "</svg>\n";
}

void SvgExport::writeCluster(std::ostream& out, const Cluster& cluster) {
    out << "  <rect class=\"cluster\" "
        << "x=\"" << cluster.left() << "\" "
        << "y=\"" << cluster.top() << "\" "
        << "width=\"" << cluster.width << "\" "
        << "height=\"" << cluster.height << "\" rx=\"8\"/>\n";

    if (options_.showClusterLabels && !cluster.id.empty()) {
        out << "  <text class=\"label\" "
            << "x=\"" << cluster.centerX << "\" "
            << "y=\"" << cluster.top() + options_.fontSize + 4 << "\">"
            << escapeXml(cluster.id) << "</text>\n";
    }
}

void SvgExport::writeEdge(std::ostream& out, const EdgePath& path) {
    if (path.empty()) {
        return;
    }

    out << "  <path class=\"edge\" id=\"edge-" << escapeXml(path.id) << "\" "
        << "d=\"" << path.path << "\" marker-end=\"url(#arrowhead)\"/>\n";

    if (options_.showWaypoints && path.waypoints.size() > 2) {
        for (size_t i = 1; i + 1 < path.waypoints.size(); ++i) {
            out << "  <circle class=\"waypoint\" cx=\"" << path.waypoints[i].x
                << "\" cy=\"" << path.waypoints[i].y << "\" r=\"2\"/>\n";
        }
    }
}

void SvgExport::writeNode(std::ostream& out, const NodeId& id, const Point& position) {
    out << "  <circle class=\"node\" cx=\"" << position.x << "\" cy=\"" << position.y
        << "\" r=\"" << options_.nodeRadius << "\"/>\n";

    if (options_.showNodeLabels) {
        out << "  <text class=\"label\" "
            << "x=\"" << position.x << "\" "
            << "y=\"" << position.y - options_.nodeRadius - 4 << "\">"
            << escapeXml(id) << "</text>\n";
    }
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }

    return result;
}

}  // namespace tracevia
