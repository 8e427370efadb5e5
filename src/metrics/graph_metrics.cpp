/// @file src/metrics/graph_metrics.cpp
/// @brief GraphMetricsEngine implementation.

#include "dramanet/metrics.hpp"
#include "dramanet/graph_algorithms.hpp"

#include <algorithm>

namespace dramanet::metrics {

// ─── Degree statistics ────────────────────────────────────────────────────────

Measure GraphMetricsEngine::max_degree(const graph::InteractionGraph& g) noexcept {
    if (g.empty()) return Measure::undefined(UndefinedReason::EmptyGraph);

    std::size_t best = 0;
    for (graph::NodeIndex n = 0; n < g.node_count(); ++n) {
        best = std::max(best, g.degree(n));
    }
    return Measure::defined(static_cast<double>(best));
}

Measure GraphMetricsEngine::average_degree(const graph::InteractionGraph& g) noexcept {
    if (g.empty()) return Measure::undefined(UndefinedReason::EmptyGraph);

    // Each edge adds 1 to the degree of both endpoints.
    return Measure::defined(2.0 * static_cast<double>(g.edge_count())
                            / static_cast<double>(g.node_count()));
}

Measure GraphMetricsEngine::density(const graph::InteractionGraph& g) noexcept {
    const auto n = static_cast<double>(g.node_count());
    if (g.node_count() <= 1) return Measure::defined(0.0);
    return Measure::defined(2.0 * static_cast<double>(g.edge_count()) / (n * (n - 1.0)));
}

// ─── Path length ──────────────────────────────────────────────────────────────

Measure GraphMetricsEngine::average_path_length(const graph::InteractionGraph& g,
                                                bool& used_fallback) {
    used_fallback = false;
    if (g.empty()) return Measure::undefined(UndefinedReason::EmptyGraph);

    if (auto apl = graph::algo::average_shortest_path_length(g.adjacency())) {
        return Measure::defined(*apl);
    }

    // Disconnected: fall back to the largest component, which is connected
    // by construction.
    used_fallback = true;
    const auto giant = graph::algo::largest_component(g.adjacency());
    const auto sub   = graph::algo::induced_subgraph(g.adjacency(), giant);
    if (auto apl = graph::algo::average_shortest_path_length(sub)) {
        return Measure::defined(*apl);
    }
    return Measure::undefined(UndefinedReason::EmptyGraph);
}

// ─── Clustering ───────────────────────────────────────────────────────────────

Measure GraphMetricsEngine::clustering(const graph::InteractionGraph& g) {
    if (auto c = graph::algo::average_clustering(g.adjacency())) {
        return Measure::defined(*c);
    }
    return Measure::undefined(UndefinedReason::EmptyGraph);
}

// ─── compute ──────────────────────────────────────────────────────────────────

GraphMetrics GraphMetricsEngine::compute(const graph::InteractionGraph& g) {
    GraphMetrics m;
    m.charcount              = g.node_count();
    m.edgecount              = g.edge_count();
    m.maxdegree              = max_degree(g);
    m.avgdegree              = average_degree(g);
    m.density                = density(g);
    m.avgpathlength          = average_path_length(g, m.path_length_fallback);
    m.clustering_coefficient = clustering(g);
    m.connected_components   = graph::algo::connected_components(g.adjacency()).size();
    return m;
}

} // namespace dramanet::metrics
