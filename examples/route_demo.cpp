#include <tracevia/tracevia.h>
#include <tracevia/common/Logger.h>
#include <iostream>
#include <string>

using namespace tracevia;

namespace {

/// Small origin-tracing diagram used when no input file is given
RoutingInput sampleDiagram() {
    RoutingInput input;

    input.nodePositions = {
        {"origin", {-700, 0}},
        {"step1", {-420, -60}},
        {"step2", {-300, 60}},
        {"claim", {0, 0}},
        {"belief1", {-80, -320}},
        {"belief2", {120, -300}},
        {"source1", {-60, 320}},
        {"source2", {140, 340}},
    };

    input.clusters = {
        {"origin", -700, 0, 160, 120, {"origin"}},
        {"evolution", -360, 0, 240, 240, {"step1", "step2"}},
        {"claim", 0, 0, 160, 120, {"claim"}},
        {"beliefs", 20, -310, 320, 120, {"belief1", "belief2"}},
        {"sources", 40, 330, 320, 120, {"source1", "source2"}},
    };

    input.edges = {
        {"e-origin-step1", "origin", "step1"},
        {"e-step1-step2", "step1", "step2"},
        {"e-step2-claim", "step2", "claim"},
        {"e-belief1-claim", "belief1", "claim"},
        {"e-belief2-claim", "belief2", "claim"},
        {"e-claim-source1", "claim", "source1"},
        {"e-claim-source2", "claim", "source2"},
        {"e-claim-unknown", "claim", "link-missing"},
    };

    return input;
}

}  // namespace

int main(int argc, char** argv) {
    Logger::initialize();

    RoutingInput input;
    RoutingOptions options = RoutingOptions::standard();

    if (argc > 1) {
        auto loaded = RoutingSerializer::loadInputFromFile(argv[1]);
        auto loadedOptions = RoutingSerializer::loadOptionsFromFile(argv[1]);
        if (!loaded || !loadedOptions) {
            std::cerr << "Failed to load " << argv[1] << "\n";
            return 1;
        }
        input = std::move(*loaded);
        options = *loadedOptions;
    } else {
        input = sampleDiagram();
    }

    std::string svgPath = argc > 2 ? argv[2] : "origin_tracing.svg";

    EdgeRouter router(options);
    RoutingResult result = router.routeEdges(input);

    auto crossings = PathIntersection::findIntersectingPairs(result);
    for (const auto& [a, b] : crossings) {
        LOG_INFO("Edges '{}' and '{}' cross", a, b);
    }

    std::cout << RoutingSerializer::toJson(result) << "\n";

    SvgExportOptions svgOptions;
    svgOptions.showNodeLabels = true;
    SvgExport svg(svgOptions);
    if (!svg.exportToFile(input, result, svgPath)) {
        return 1;
    }

    std::cerr << "Routed " << result.edgeCount() << " edges, dropped "
              << result.droppedEdges().size() << ", crossings " << crossings.size()
              << ", wrote " << svgPath << "\n";
    return 0;
}
