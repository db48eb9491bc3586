#include "tracevia/util/RoutingSerializer.h"
#include "tracevia/common/Logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace tracevia {

namespace {
    constexpr int RESULT_FORMAT_VERSION = 1;

    json pointToJson(const Point& p) {
        return {{"x", p.x}, {"y", p.y}};
    }

    Point pointFromJson(const json& j) {
        return {j.at("x").get<float>(), j.at("y").get<float>()};
    }

    json optionsToJsonObject(const RoutingOptions& options) {
        return {
            {"curveStyle", RoutingSerializer::curveStyleToString(options.curveStyle)},
            {"clusterClearance", options.clusterClearance},
            {"parallelThreshold", options.parallelThreshold},
            {"offsetIncrement", options.offsetIncrement},
            {"membershipPolicy", RoutingSerializer::membershipPolicyToString(options.membershipPolicy)}
        };
    }

    RoutingOptions optionsFromJsonObject(const json& j) {
        RoutingOptions options = RoutingOptions::standard();
        if (j.contains("curveStyle")) {
            options.curveStyle = RoutingSerializer::stringToCurveStyle(j["curveStyle"].get<std::string>());
        }
        options.clusterClearance = j.value("clusterClearance", options.clusterClearance);
        options.parallelThreshold = j.value("parallelThreshold", options.parallelThreshold);
        options.offsetIncrement = j.value("offsetIncrement", options.offsetIncrement);
        if (j.contains("membershipPolicy")) {
            options.membershipPolicy =
                RoutingSerializer::stringToMembershipPolicy(j["membershipPolicy"].get<std::string>());
        }
        return options;
    }

    std::optional<std::string> readFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
}  // anonymous namespace

// === Enum names ===

std::string RoutingSerializer::curveStyleToString(CurveStyle style) {
    switch (style) {
        case CurveStyle::Smooth: return "smooth";
        case CurveStyle::Tight: return "tight";
    }
    return "smooth";
}

CurveStyle RoutingSerializer::stringToCurveStyle(const std::string& str) {
    if (str == "smooth") return CurveStyle::Smooth;
    if (str == "tight") return CurveStyle::Tight;
    throw std::runtime_error("Unknown curve style: " + str);
}

std::string RoutingSerializer::membershipPolicyToString(ClusterMembershipPolicy policy) {
    switch (policy) {
        case ClusterMembershipPolicy::LastWins: return "last_wins";
        case ClusterMembershipPolicy::FirstWins: return "first_wins";
    }
    return "last_wins";
}

ClusterMembershipPolicy RoutingSerializer::stringToMembershipPolicy(const std::string& str) {
    if (str == "last_wins") return ClusterMembershipPolicy::LastWins;
    if (str == "first_wins") return ClusterMembershipPolicy::FirstWins;
    throw std::runtime_error("Unknown membership policy: " + str);
}

DropReason RoutingSerializer::stringToDropReason(const std::string& str) {
    if (str == "missing_source") return DropReason::MissingSource;
    if (str == "missing_target") return DropReason::MissingTarget;
    if (str == "missing_both") return DropReason::MissingBoth;
    throw std::runtime_error("Unknown drop reason: " + str);
}

// === RoutingInput ===

std::string RoutingSerializer::toJson(const RoutingInput& input) {
    json j;

    json positions = json::object();
    for (const auto& [id, pos] : input.nodePositions) {
        positions[id] = pointToJson(pos);
    }
    j["nodePositions"] = positions;

    json clusters = json::array();
    for (const auto& cluster : input.clusters) {
        clusters.push_back({
            {"id", cluster.id},
            {"centerX", cluster.centerX},
            {"centerY", cluster.centerY},
            {"width", cluster.width},
            {"height", cluster.height},
            {"nodeIds", cluster.nodeIds}
        });
    }
    j["clusters"] = clusters;

    json edges = json::array();
    for (const auto& edge : input.edges) {
        edges.push_back({{"id", edge.id}, {"source", edge.source}, {"target", edge.target}});
    }
    j["edges"] = edges;

    return j.dump(2);
}

RoutingInput RoutingSerializer::inputFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        RoutingInput input;

        if (j.contains("nodePositions")) {
            for (auto& [key, value] : j["nodePositions"].items()) {
                input.nodePositions[key] = pointFromJson(value);
            }
        }

        if (j.contains("clusters")) {
            for (const auto& c : j["clusters"]) {
                Cluster cluster;
                cluster.id = c.at("id").get<std::string>();
                cluster.centerX = c.at("centerX").get<float>();
                cluster.centerY = c.at("centerY").get<float>();
                cluster.width = c.at("width").get<float>();
                cluster.height = c.value("height", 0.0f);
                cluster.nodeIds = c.value("nodeIds", std::vector<NodeId>{});
                input.clusters.push_back(std::move(cluster));
            }
        }

        if (j.contains("edges")) {
            for (const auto& e : j["edges"]) {
                input.edges.push_back({
                    e.at("id").get<std::string>(),
                    e.at("source").get<std::string>(),
                    e.at("target").get<std::string>()
                });
            }
        }

        return input;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse RoutingInput JSON: ") + e.what());
    }
}

std::optional<RoutingInput> RoutingSerializer::loadInputFromFile(const std::string& path) {
    auto content = readFile(path);
    if (!content) {
        LOG_ERROR("Cannot open routing input '{}'", path);
        return std::nullopt;
    }

    try {
        return inputFromJson(*content);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Invalid routing input '{}': {}", path, e.what());
        return std::nullopt;
    }
}

// === RoutingOptions ===

std::string RoutingSerializer::toJson(const RoutingOptions& options) {
    return optionsToJsonObject(options).dump(2);
}

RoutingOptions RoutingSerializer::optionsFromJson(const std::string& jsonStr) {
    try {
        return optionsFromJsonObject(json::parse(jsonStr));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse RoutingOptions JSON: ") + e.what());
    }
}

RoutingOptions RoutingSerializer::optionsFromInputJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        if (!j.contains("options")) {
            return RoutingOptions::standard();
        }
        return optionsFromJsonObject(j["options"]);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse RoutingOptions JSON: ") + e.what());
    }
}

std::optional<RoutingOptions> RoutingSerializer::loadOptionsFromFile(const std::string& path) {
    auto content = readFile(path);
    if (!content) {
        LOG_ERROR("Cannot open routing input '{}'", path);
        return std::nullopt;
    }

    try {
        return optionsFromInputJson(*content);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Invalid routing options in '{}': {}", path, e.what());
        return std::nullopt;
    }
}

// === RoutingResult ===

std::string RoutingSerializer::toJson(const RoutingResult& result) {
    json j;
    j["version"] = RESULT_FORMAT_VERSION;

    json edgePaths = json::array();
    for (const auto& id : result.routingOrder()) {
        const EdgePath* path = result.getEdgePath(id);
        if (!path) continue;

        json waypoints = json::array();
        for (const auto& p : path->waypoints) {
            waypoints.push_back(pointToJson(p));
        }
        edgePaths.push_back({{"id", path->id}, {"path", path->path}, {"waypoints", waypoints}});
    }
    j["edgePaths"] = edgePaths;

    json dropped = json::array();
    for (const auto& d : result.droppedEdges()) {
        dropped.push_back({{"edgeId", d.edgeId}, {"reason", dropReasonToString(d.reason)}});
    }
    j["droppedEdges"] = dropped;

    json conflicts = json::array();
    for (const auto& c : result.membershipConflicts()) {
        conflicts.push_back({
            {"nodeId", c.nodeId},
            {"keptClusterId", c.keptClusterId},
            {"ignoredClusterId", c.ignoredClusterId}
        });
    }
    j["membershipConflicts"] = conflicts;

    return j.dump(2);
}

RoutingResult RoutingSerializer::resultFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        RoutingResult result;

        for (const auto& e : j.at("edgePaths")) {
            EdgePath path;
            path.id = e.at("id").get<std::string>();
            path.path = e.value("path", std::string{});
            for (const auto& p : e.at("waypoints")) {
                path.waypoints.push_back(pointFromJson(p));
            }
            result.setEdgePath(path);
        }

        if (j.contains("droppedEdges")) {
            for (const auto& d : j["droppedEdges"]) {
                result.addDroppedEdge(d.at("edgeId").get<std::string>(),
                                      stringToDropReason(d.at("reason").get<std::string>()));
            }
        }

        if (j.contains("membershipConflicts")) {
            std::vector<MembershipConflict> conflicts;
            for (const auto& c : j["membershipConflicts"]) {
                conflicts.push_back({
                    c.at("nodeId").get<std::string>(),
                    c.at("keptClusterId").get<std::string>(),
                    c.at("ignoredClusterId").get<std::string>()
                });
            }
            result.setMembershipConflicts(std::move(conflicts));
        }

        return result;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse RoutingResult JSON: ") + e.what());
    }
}

bool RoutingSerializer::saveToFile(const RoutingResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot write routing result '{}'", path);
        return false;
    }
    file << toJson(result);
    return file.good();
}

}  // namespace tracevia
