/// @file tests/metrics/test_graph_metrics.cpp
/// @brief Tests for GraphMetricsEngine, including the largest-component
///        path-length fallback.

#include <gtest/gtest.h>
#include "dramanet/metrics.hpp"

using namespace dramanet;
using namespace dramanet::graph;
using namespace dramanet::metrics;

// ─── Connected graphs ────────────────────────────────────────────────────────

TEST(GraphMetrics_Compute, Triangle) {
    const auto g = GraphBuilder::build({{"A", "B"}, {"B", "C"}, {"A", "C"}});
    const auto m = GraphMetricsEngine::compute(g);

    EXPECT_EQ(m.charcount, 3u);
    EXPECT_EQ(m.edgecount, 3u);
    EXPECT_DOUBLE_EQ(m.maxdegree.value(), 2.0);
    EXPECT_DOUBLE_EQ(m.avgdegree.value(), 2.0);
    EXPECT_DOUBLE_EQ(m.density.value(), 1.0);
    EXPECT_DOUBLE_EQ(m.avgpathlength.value(), 1.0);
    EXPECT_DOUBLE_EQ(m.clustering_coefficient.value(), 1.0);
    EXPECT_EQ(m.connected_components, 1u);
    EXPECT_FALSE(m.path_length_fallback);
}

TEST(GraphMetrics_Compute, Star) {
    // Hub H with three leaves.
    const auto g = GraphBuilder::build({{"H", "X"}, {"H", "Y"}, {"H", "Z"}});
    const auto m = GraphMetricsEngine::compute(g);

    EXPECT_DOUBLE_EQ(m.maxdegree.value(), 3.0);
    EXPECT_DOUBLE_EQ(m.avgdegree.value(), 1.5);
    EXPECT_DOUBLE_EQ(m.density.value(), 0.5);
    // 3 pairs at distance 1 and 3 at distance 2, each counted twice: 18 / 12
    EXPECT_DOUBLE_EQ(m.avgpathlength.value(), 1.5);
    EXPECT_DOUBLE_EQ(m.clustering_coefficient.value(), 0.0);
}

TEST(GraphMetrics_Compute, SingleCharacter) {
    const auto g = GraphBuilder::build({{"Solo"}, {"Solo"}});
    const auto m = GraphMetricsEngine::compute(g);

    EXPECT_EQ(m.charcount, 1u);
    EXPECT_DOUBLE_EQ(m.maxdegree.value(), 0.0);
    EXPECT_DOUBLE_EQ(m.density.value(), 0.0);
    EXPECT_DOUBLE_EQ(m.avgpathlength.value(), 0.0);
    EXPECT_DOUBLE_EQ(m.clustering_coefficient.value(), 0.0);
    EXPECT_EQ(m.connected_components, 1u);
}

// ─── Disconnected graphs ─────────────────────────────────────────────────────

TEST(GraphMetrics_Fallback, UsesLargestComponent) {
    // Path A-B-C plus a separate pair D-E.
    const auto g = GraphBuilder::build({{"A", "B"}, {"B", "C"}, {"D", "E"}});
    const auto m = GraphMetricsEngine::compute(g);

    EXPECT_TRUE(m.path_length_fallback);
    EXPECT_EQ(m.connected_components, 2u);
    EXPECT_NEAR(m.avgpathlength.value(), 4.0 / 3.0, 1e-12);
}

TEST(GraphMetrics_Fallback, IsolatedCharacters_ZeroPathLength) {
    const auto g = GraphBuilder::build({{"A"}, {"B"}});
    bool fallback = false;
    const auto apl = GraphMetricsEngine::average_path_length(g, fallback);

    EXPECT_TRUE(fallback);
    EXPECT_DOUBLE_EQ(apl.value(), 0.0);
}

TEST(GraphMetrics_Fallback, EqualComponents_FirstInIdOrder) {
    // {A,B} and {C,D,E}: the triangle is larger regardless of order.
    const auto g = GraphBuilder::build({{"A", "B"}, {"C", "D", "E"}});
    const auto m = GraphMetricsEngine::compute(g);
    EXPECT_DOUBLE_EQ(m.avgpathlength.value(), 1.0);
}

// ─── Empty graph ─────────────────────────────────────────────────────────────

TEST(GraphMetrics_Empty, UndefinedExceptCountsAndDensity) {
    const auto m = GraphMetricsEngine::compute(InteractionGraph{});

    EXPECT_EQ(m.charcount, 0u);
    EXPECT_EQ(m.edgecount, 0u);
    EXPECT_EQ(m.connected_components, 0u);
    EXPECT_DOUBLE_EQ(m.density.value(), 0.0);
    EXPECT_FALSE(m.maxdegree.is_defined());
    EXPECT_FALSE(m.avgdegree.is_defined());
    EXPECT_FALSE(m.avgpathlength.is_defined());
    EXPECT_FALSE(m.clustering_coefficient.is_defined());
    EXPECT_EQ(m.avgpathlength.reason(), UndefinedReason::EmptyGraph);
    EXPECT_FALSE(m.path_length_fallback);
}
