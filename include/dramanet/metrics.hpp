#pragma once

/// @file include/dramanet/metrics.hpp
/// @brief Graph Metrics Engine: whole-graph statistics of an interaction graph.
///
/// # Module: Graph Metrics
///
/// ## Metrics
///   - charcount, edgecount
///   - maxdegree, avgdegree = 2e / n
///   - density              = 2e / (n (n − 1)),  0 for n ≤ 1
///   - avgpathlength        = mean hop distance over ordered node pairs
///   - clustering_coefficient = mean local clustering coefficient
///   - connected_components
///
/// ## Largest-component fallback
/// A disconnected graph has no finite average path length. In that case the
/// value is computed on the largest connected component instead and
/// `path_length_fallback` is set; the analyzer then shrinks the null-model
/// budget (see constants::FALLBACK_RANDOMIZATION).
///
/// ## Guarantees
/// - Each metric is computed on its own; an undefined one never blocks the
///   others
/// - Undefined values carry an UndefinedReason, never a magic number

#include "dramanet/graph.hpp"
#include "dramanet/types.hpp"

#include <cstddef>

namespace dramanet::metrics {

/// Aggregate statistics of one interaction graph.
struct GraphMetrics {
    std::size_t charcount            = 0;
    std::size_t edgecount            = 0;
    Measure     maxdegree            = Measure::undefined(UndefinedReason::EmptyGraph);
    Measure     avgdegree            = Measure::undefined(UndefinedReason::EmptyGraph);
    Measure     density              = Measure::defined(0.0);
    Measure     avgpathlength        = Measure::undefined(UndefinedReason::EmptyGraph);
    Measure     clustering_coefficient = Measure::undefined(UndefinedReason::EmptyGraph);
    std::size_t connected_components = 0;

    /// True when avgpathlength was taken from the largest component.
    bool path_length_fallback = false;
};

/// Stateless calculator for GraphMetrics.
class GraphMetricsEngine {
public:
    [[nodiscard]] static GraphMetrics compute(const graph::InteractionGraph& g);

    [[nodiscard]] static Measure max_degree(const graph::InteractionGraph& g) noexcept;
    [[nodiscard]] static Measure average_degree(const graph::InteractionGraph& g) noexcept;
    [[nodiscard]] static Measure density(const graph::InteractionGraph& g) noexcept;

    /// Average path length with the largest-component fallback.
    /// `used_fallback` is set iff the graph was disconnected.
    [[nodiscard]] static Measure
    average_path_length(const graph::InteractionGraph& g, bool& used_fallback);

    [[nodiscard]] static Measure clustering(const graph::InteractionGraph& g);
};

} // namespace dramanet::metrics
