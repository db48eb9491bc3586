#pragma once

#include "../core/Types.h"
#include "../routing/RoutingOptions.h"
#include "../routing/RoutingResult.h"

#include <optional>
#include <string>

namespace tracevia {

/// JSON serialization and file I/O for routing input, options and results
///
/// Input document:
/// @code
/// {
///   "nodePositions": {"claim": {"x": 0, "y": 0}},
///   "clusters": [{"id": "core", "centerX": 0, "centerY": 0,
///                 "width": 200, "height": 100, "nodeIds": ["claim"]}],
///   "edges": [{"id": "e1", "source": "claim", "target": "src1"}],
///   "options": {"curveStyle": "smooth", "clusterClearance": 40}
/// }
/// @endcode
class RoutingSerializer {
public:
    // === RoutingInput ===

    static std::string toJson(const RoutingInput& input);

    /// @throws std::runtime_error on malformed JSON or missing fields
    static RoutingInput inputFromJson(const std::string& json);

    /// @return std::nullopt if the file cannot be read or parsed
    static std::optional<RoutingInput> loadInputFromFile(const std::string& path);

    // === RoutingOptions ===

    static std::string toJson(const RoutingOptions& options);

    /// Missing keys keep their standard() values
    /// @throws std::runtime_error on malformed JSON or unknown enum names
    static RoutingOptions optionsFromJson(const std::string& json);

    /// Options embedded in an input document ("options" key)
    /// @return standard() if the document has no "options" key
    /// @throws std::runtime_error on malformed JSON
    static RoutingOptions optionsFromInputJson(const std::string& json);

    /// Options of an input document on disk
    /// @return std::nullopt if the file cannot be read or parsed
    static std::optional<RoutingOptions> loadOptionsFromFile(const std::string& path);

    // === RoutingResult ===

    /// Edge paths in routing order plus diagnostics
    static std::string toJson(const RoutingResult& result);

    /// @throws std::runtime_error on malformed JSON or missing fields
    static RoutingResult resultFromJson(const std::string& json);

    static bool saveToFile(const RoutingResult& result, const std::string& path);

    // === Enum names ===

    static std::string curveStyleToString(CurveStyle style);
    static CurveStyle stringToCurveStyle(const std::string& str);
    static std::string membershipPolicyToString(ClusterMembershipPolicy policy);
    static ClusterMembershipPolicy stringToMembershipPolicy(const std::string& str);
    static DropReason stringToDropReason(const std::string& str);
};

}  // namespace tracevia
