#include <gtest/gtest.h>
#include "../../src/routing/PathStrategy.h"

using namespace tracevia;

class PathStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        // right() == 50 and left() == 350
        left_ = {"claim", 0, 0, 100, 200, {"a"}};
        right_ = {"sources", 400, 0, 100, 200, {"b"}};
    }

    void expectWaypoints(const std::vector<Point>& actual, const std::vector<Point>& expected) {
        ASSERT_EQ(actual.size(), expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            EXPECT_FLOAT_EQ(actual[i].x, expected[i].x) << "waypoint " << i;
            EXPECT_FLOAT_EQ(actual[i].y, expected[i].y) << "waypoint " << i;
        }
    }

    Cluster left_;
    Cluster right_;
};

// ============== Classification Tests ==============

TEST_F(PathStrategyTest, ClassifySameClusterIsBezier) {
    EXPECT_EQ(PathStrategy::classify(&left_, &left_), RouteKind::Bezier);
}

TEST_F(PathStrategyTest, ClassifyUnclusteredEndpointIsBezier) {
    EXPECT_EQ(PathStrategy::classify(&left_, nullptr), RouteKind::Bezier);
    EXPECT_EQ(PathStrategy::classify(nullptr, &right_), RouteKind::Bezier);
    EXPECT_EQ(PathStrategy::classify(nullptr, nullptr), RouteKind::Bezier);
}

TEST_F(PathStrategyTest, ClassifyDifferentClustersIsOrthogonal) {
    EXPECT_EQ(PathStrategy::classify(&left_, &right_), RouteKind::Orthogonal);
}

// ============== Bezier Tests ==============

TEST_F(PathStrategyTest, BezierRouteKeepsBareEndpoints) {
    PathStrategy strategy;
    auto routed = strategy.bezierRoute({0, 0}, {100, 50});

    EXPECT_EQ(routed.path, "M 0,0 C 40,0 60,50 100,50");
    expectWaypoints(routed.waypoints, {{0, 0}, {100, 50}});
}

TEST_F(PathStrategyTest, BezierRouteUsesTightCurvature) {
    PathStrategy strategy(RoutingOptions().withCurveStyle(CurveStyle::Tight));
    auto routed = strategy.bezierRoute({0, 0}, {100, 50});

    EXPECT_EQ(routed.path, "M 0,0 C 25,0 75,50 100,50");
}

TEST_F(PathStrategyTest, RouteIgnoresOffsetForBezier) {
    PathStrategy strategy;
    auto routed = strategy.route({0, 0}, {100, 50}, &left_, &left_, 75.0f);

    EXPECT_EQ(routed.path, "M 0,0 C 40,0 60,50 100,50");
}

// ============== Orthogonal Tests ==============

TEST_F(PathStrategyTest, OrthogonalRouteWithoutOffset) {
    PathStrategy strategy;
    auto routed = strategy.route({50, 0}, {350, 0}, &left_, &right_);

    expectWaypoints(routed.waypoints,
                    {{50, 0}, {90, 0}, {200, 0}, {200, 0}, {310, 0}, {350, 0}});
    EXPECT_EQ(routed.path,
              "M 50,0 L 90,0 Q 90,0 90,0 L 200,0 Q 200,0 200,0 L 200,0 Q 200,0 200,0 "
              "L 310,0 Q 310,0 310,0 C 330,0 350,0 350,0");
}

TEST_F(PathStrategyTest, OrthogonalRouteShiftsTravelLevelByOffset) {
    PathStrategy strategy;
    auto routed = strategy.route({50, 0}, {350, 100}, &left_, &right_, 25.0f);

    expectWaypoints(routed.waypoints,
                    {{50, 0}, {90, 25}, {200, 25}, {200, 125}, {310, 125}, {350, 100}});
    EXPECT_EQ(routed.path,
              "M 50,0 L 90,0 Q 90,25 90,25 L 200,25 Q 200,25 200,25 "
              "L 200,125 Q 200,125 200,125 L 310,125 Q 310,125 310,125 "
              "C 330,112.5 350,100 350,100");
}

TEST_F(PathStrategyTest, OrthogonalRouteUsesConfiguredClearance) {
    PathStrategy strategy(RoutingOptions::compact());
    auto routed = strategy.route({50, 0}, {350, 0}, &left_, &right_);

    ASSERT_EQ(routed.waypoints.size(), 6u);
    EXPECT_FLOAT_EQ(routed.waypoints[1].x, 70.0f);
    EXPECT_FLOAT_EQ(routed.waypoints[4].x, 330.0f);
    EXPECT_FLOAT_EQ(routed.waypoints[2].x, 200.0f);
}

TEST_F(PathStrategyTest, OrthogonalRouteWithoutSourceClusterStartsAtSource) {
    PathStrategy strategy;
    auto routed = strategy.orthogonalRoute({0, 0}, {350, 0}, nullptr, &right_, 0.0f);

    expectWaypoints(routed.waypoints, {{0, 0}, {155, 0}, {155, 0}, {310, 0}, {350, 0}});
}

TEST_F(PathStrategyTest, OrthogonalRouteWithoutTargetClusterEndsAfterExit) {
    PathStrategy strategy;
    auto routed = strategy.orthogonalRoute({50, 0}, {300, 80}, &left_, nullptr, 10.0f);

    expectWaypoints(routed.waypoints, {{50, 0}, {90, 10}, {300, 80}});
}

TEST_F(PathStrategyTest, OrthogonalWaypointsAreAxisAlignedBetweenColumns) {
    PathStrategy strategy;
    auto routed = strategy.route({50, -40}, {350, 60}, &left_, &right_, 25.0f);

    const auto& w = routed.waypoints;
    ASSERT_EQ(w.size(), 6u);
    EXPECT_FLOAT_EQ(w[1].y, w[2].y);  // horizontal to the middle column
    EXPECT_FLOAT_EQ(w[2].x, w[3].x);  // vertical in the middle column
    EXPECT_FLOAT_EQ(w[3].y, w[4].y);  // horizontal to the entry column
}

// ============== Degenerate Tests ==============

TEST_F(PathStrategyTest, CoincidentEndpointsGiveEmptyBezierPath) {
    PathStrategy strategy;
    auto routed = strategy.route({10, 10}, {10, 10}, &left_, &left_);

    EXPECT_TRUE(routed.path.empty());
    expectWaypoints(routed.waypoints, {{10, 10}, {10, 10}});
}

TEST_F(PathStrategyTest, CoincidentEndpointsAcrossClustersGiveEmptyPath) {
    PathStrategy strategy;
    auto routed = strategy.route({50, 0}, {50, 0}, &left_, &right_);

    EXPECT_TRUE(routed.path.empty());
    expectWaypoints(routed.waypoints, {{50, 0}, {50, 0}});
}
