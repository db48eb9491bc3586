#pragma once

#include "../routing/RoutingResult.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace tracevia {

/// Options for SVG export
struct SvgExportOptions {
    // Canvas settings
    float padding = 40.0f;
    std::string backgroundColor = "white";

    // Cluster styling (dashed frame)
    std::string clusterFill = "#f5f7fa";
    std::string clusterStroke = "#8a94a6";
    std::string clusterStrokeDasharray = "6,4";
    float clusterStrokeWidth = 1.0f;

    // Node styling
    std::string nodeFill = "#333333";
    float nodeRadius = 4.0f;

    // Edge styling
    std::string edgeStroke = "#4a90d9";
    float edgeStrokeWidth = 1.5f;

    // Text styling
    std::string textFill = "#000000";
    std::string fontFamily = "Arial, sans-serif";
    float fontSize = 12.0f;

    bool showClusterLabels = true;
    bool showNodeLabels = false;

    // Draw waypoints of orthogonal routes as small markers
    bool showWaypoints = false;
};

/// Writes a routed diagram as a standalone SVG document
///
/// Clusters are drawn first, then edges, then nodes on top. Edges with an
/// empty path (degenerate) are skipped.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const RoutingInput& input, const RoutingResult& result) override;
    void exportToStream(const RoutingInput& input, const RoutingResult& result, std::ostream& out) override;
    bool exportToFile(const RoutingInput& input, const RoutingResult& result, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

private:
    struct Bounds {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
    };

    SvgExportOptions options_;

    Bounds computeBounds(const RoutingInput& input, const RoutingResult& result) const;

    void writeHeader(std::ostream& out, const Bounds& bounds);
    void writeStyles(std::ostream& out);
    void writeMarkers(std::ostream& out);
    void writeFooter(std::ostream& out);

    void writeCluster(std::ostream& out, const Cluster& cluster);
    void writeEdge(std::ostream& out, const EdgePath& path);
    void writeNode(std::ostream& out, const NodeId& id, const Point& position);

    static std::string escapeXml(const std::string& text);
};

}  // namespace tracevia
