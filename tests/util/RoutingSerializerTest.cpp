#include <gtest/gtest.h>
#include <tracevia/util/RoutingSerializer.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace tracevia;
using json = nlohmann::json;

class RoutingSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        input_.nodePositions = {{"claim", {0, 0}}, {"src-1", {400, 20}}};
        input_.clusters = {
            {"core", 0, 0, 200, 100, {"claim"}},
            {"sources", 400, 0, 200, 150, {"src-1"}},
        };
        input_.edges = {{"e1", "claim", "src-1"}};

        result_.setEdgePath({"e1", "M 0,0 C 40,0 60,50 100,50", {{0, 0}, {100, 50}}});
        result_.setEdgePath({"e2", "M 5,5 C 5,5 5,5 5,5", {{5, 5}, {5.5f, 5}}});
        result_.addDroppedEdge("e3", DropReason::MissingTarget);
        result_.setMembershipConflicts({{"claim", "sources", "core"}});
    }

    void TearDown() override {
        for (const auto& path : tempFiles_) {
            std::remove(path.c_str());
        }
    }

    std::string tempPath(const std::string& name) {
        auto path = (std::filesystem::temp_directory_path() / name).string();
        tempFiles_.push_back(path);
        return path;
    }

    RoutingInput input_;
    RoutingResult result_;
    std::vector<std::string> tempFiles_;
};

// ============== RoutingInput Tests ==============

TEST_F(RoutingSerializerTest, InputSurvivesJson) {
    RoutingInput loaded = RoutingSerializer::inputFromJson(RoutingSerializer::toJson(input_));

    ASSERT_EQ(loaded.nodePositions.size(), 2u);
    EXPECT_FLOAT_EQ(loaded.nodePositions.at("src-1").y, 20.0f);
    ASSERT_EQ(loaded.clusters.size(), 2u);
    EXPECT_EQ(loaded.clusters[1].id, "sources");
    EXPECT_FLOAT_EQ(loaded.clusters[1].height, 150.0f);
    EXPECT_EQ(loaded.clusters[1].nodeIds, std::vector<NodeId>{"src-1"});
    ASSERT_EQ(loaded.edges.size(), 1u);
    EXPECT_EQ(loaded.edges[0].target, "src-1");
}

TEST_F(RoutingSerializerTest, InputSectionsAreOptional) {
    RoutingInput loaded = RoutingSerializer::inputFromJson(R"({"edges": []})");

    EXPECT_TRUE(loaded.nodePositions.empty());
    EXPECT_TRUE(loaded.clusters.empty());
    EXPECT_TRUE(loaded.edges.empty());
}

TEST_F(RoutingSerializerTest, ClusterHeightAndNodesDefault) {
    RoutingInput loaded = RoutingSerializer::inputFromJson(
        R"({"clusters": [{"id": "c", "centerX": 1, "centerY": 2, "width": 3}]})");

    ASSERT_EQ(loaded.clusters.size(), 1u);
    EXPECT_FLOAT_EQ(loaded.clusters[0].height, 0.0f);
    EXPECT_TRUE(loaded.clusters[0].nodeIds.empty());
}

TEST_F(RoutingSerializerTest, MalformedInputThrows) {
    EXPECT_THROW(RoutingSerializer::inputFromJson("{not json"), std::runtime_error);
    EXPECT_THROW(RoutingSerializer::inputFromJson(R"({"edges": [{"id": "e1"}]})"),
                 std::runtime_error);
}

TEST_F(RoutingSerializerTest, LoadInputFromMissingFileIsNullopt) {
    EXPECT_FALSE(RoutingSerializer::loadInputFromFile("/nonexistent/tracevia/input.json").has_value());
}

TEST_F(RoutingSerializerTest, LoadInputFromFile) {
    std::string path = tempPath("tracevia_input_test.json");
    {
        std::ofstream out(path);
        out << RoutingSerializer::toJson(input_);
    }

    auto loaded = RoutingSerializer::loadInputFromFile(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->edges.size(), 1u);
}

// ============== RoutingOptions Tests ==============

TEST_F(RoutingSerializerTest, OptionsSurviveJson) {
    auto options = RoutingOptions::compact().withMembershipPolicy(ClusterMembershipPolicy::FirstWins);
    auto loaded = RoutingSerializer::optionsFromJson(RoutingSerializer::toJson(options));

    EXPECT_EQ(loaded.curveStyle, CurveStyle::Tight);
    EXPECT_FLOAT_EQ(loaded.clusterClearance, 20.0f);
    EXPECT_FLOAT_EQ(loaded.parallelThreshold, 60.0f);
    EXPECT_FLOAT_EQ(loaded.offsetIncrement, 15.0f);
    EXPECT_EQ(loaded.membershipPolicy, ClusterMembershipPolicy::FirstWins);
}

TEST_F(RoutingSerializerTest, MissingOptionKeysKeepStandardValues) {
    auto loaded = RoutingSerializer::optionsFromJson(R"({"offsetIncrement": 10})");

    EXPECT_EQ(loaded.curveStyle, CurveStyle::Smooth);
    EXPECT_FLOAT_EQ(loaded.clusterClearance, 40.0f);
    EXPECT_FLOAT_EQ(loaded.offsetIncrement, 10.0f);
    EXPECT_EQ(loaded.membershipPolicy, ClusterMembershipPolicy::LastWins);
}

TEST_F(RoutingSerializerTest, UnknownEnumNameThrows) {
    EXPECT_THROW(RoutingSerializer::optionsFromJson(R"({"curveStyle": "wavy"})"), std::runtime_error);
    EXPECT_THROW(RoutingSerializer::stringToMembershipPolicy("random"), std::runtime_error);
    EXPECT_THROW(RoutingSerializer::stringToDropReason("lost"), std::runtime_error);
}

TEST_F(RoutingSerializerTest, OptionsFromInputDocument) {
    auto withOptions = RoutingSerializer::optionsFromInputJson(
        R"({"edges": [], "options": {"curveStyle": "tight"}})");
    auto withoutOptions = RoutingSerializer::optionsFromInputJson(R"({"edges": []})");

    EXPECT_EQ(withOptions.curveStyle, CurveStyle::Tight);
    EXPECT_EQ(withoutOptions.curveStyle, CurveStyle::Smooth);
    EXPECT_FLOAT_EQ(withoutOptions.parallelThreshold, 100.0f);
}

// ============== RoutingResult Tests ==============

TEST_F(RoutingSerializerTest, ResultJsonListsEdgesInRoutingOrder) {
    json j = json::parse(RoutingSerializer::toJson(result_));

    EXPECT_EQ(j["version"], 1);
    ASSERT_EQ(j["edgePaths"].size(), 2u);
    EXPECT_EQ(j["edgePaths"][0]["id"], "e1");
    EXPECT_EQ(j["edgePaths"][0]["path"], "M 0,0 C 40,0 60,50 100,50");
    EXPECT_EQ(j["edgePaths"][1]["id"], "e2");
    EXPECT_EQ(j["droppedEdges"][0]["reason"], "missing_target");
    EXPECT_EQ(j["membershipConflicts"][0]["keptClusterId"], "sources");
}

TEST_F(RoutingSerializerTest, ResultSurvivesJson) {
    RoutingResult loaded = RoutingSerializer::resultFromJson(RoutingSerializer::toJson(result_));

    EXPECT_EQ(loaded.routingOrder(), result_.routingOrder());
    ASSERT_TRUE(loaded.hasEdgePath("e2"));
    EXPECT_FLOAT_EQ(loaded.getEdgePath("e2")->waypoints[1].x, 5.5f);
    EXPECT_TRUE(loaded.wasDropped("e3"));
    EXPECT_EQ(loaded.droppedEdges()[0].reason, DropReason::MissingTarget);
    ASSERT_EQ(loaded.membershipConflicts().size(), 1u);
    EXPECT_EQ(loaded.membershipConflicts()[0].ignoredClusterId, "core");
}

TEST_F(RoutingSerializerTest, ResultWithoutEdgePathsThrows) {
    EXPECT_THROW(RoutingSerializer::resultFromJson(R"({"version": 1})"), std::runtime_error);
}

TEST_F(RoutingSerializerTest, SaveResultToFile) {
    std::string path = tempPath("tracevia_result_test.json");

    ASSERT_TRUE(RoutingSerializer::saveToFile(result_, path));

    std::ifstream in(path);
    json j = json::parse(in);
    EXPECT_EQ(j["edgePaths"].size(), 2u);
}

TEST_F(RoutingSerializerTest, SaveToUnwritablePathFails) {
    EXPECT_FALSE(RoutingSerializer::saveToFile(result_, "/nonexistent/tracevia/result.json"));
}
