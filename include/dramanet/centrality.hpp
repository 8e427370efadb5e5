#pragma once

/// @file include/dramanet/centrality.hpp
/// @brief Centrality Engine: per-character network statistics.
///
/// # Module: Centrality
///
/// ## Metrics (all on the unweighted graph)
///   - degree:      number of neighbours
///   - betweenness: Σ_{s≠v≠t} σ_st(v) / σ_st, divided by (n−1)(n−2)/2 for n > 2
///   - closeness:   (r−1)/Σd · (r−1)/(n−1)
///                  r = nodes reachable from v (v included), Σd = their total
///                  hop distance; 0 when Σd = 0
///   - frequency:   number of segments the character appears in, counted on
///                  the segment sequence itself
///
/// Isolated nodes get 0 for betweenness and closeness; nothing here fails.
///
/// ## Table layout
/// One row per graph node, in node order. The rank fields are left at 0
/// here and filled in by ranking::RankAggregator.

#include "dramanet/graph.hpp"
#include "dramanet/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace dramanet::centrality {

/// Network statistics and ranks of one character.
struct CharacterMetrics {
    CharacterId id;
    std::size_t frequency   = 0;
    std::size_t degree      = 0;
    double      betweenness = 0.0;
    double      closeness   = 0.0;

    // Dense ranks (1 = highest value); filled by RankAggregator.
    std::size_t degree_rank      = 0;
    std::size_t closeness_rank   = 0;
    std::size_t betweenness_rank = 0;
    std::size_t frequency_rank   = 0;
    double      avg_centrality_rank  = 0.0;
    double      composite_centrality = 0.0;
};

/// Row-oriented character table keyed by id. Read-only once built;
/// RankAggregator::rank returns a new table.
class CharacterMetricsTable {
public:
    CharacterMetricsTable() = default;
    explicit CharacterMetricsTable(std::vector<CharacterMetrics> rows)
        : rows_(std::move(rows)) {}

    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    [[nodiscard]] const std::vector<CharacterMetrics>& rows() const noexcept { return rows_; }

    /// Row of `id`, or nullptr if the character is not in the table.
    [[nodiscard]] const CharacterMetrics* find(std::string_view id) const noexcept;

private:
    std::vector<CharacterMetrics> rows_;
};

/// Stateless calculator for per-character statistics.
class CentralityEngine {
public:
    /// Build the table for every node of `g`.
    [[nodiscard]] static CharacterMetricsTable
    compute(const graph::InteractionGraph& g, const SegmentSequence& segments);

    /// Normalized betweenness per node (Brandes).
    [[nodiscard]] static std::vector<double> betweenness(const graph::Adjacency& adj);

    /// Closeness per node, scaled by the reachable fraction.
    [[nodiscard]] static std::vector<double> closeness(const graph::Adjacency& adj);

    /// Number of segments containing `id`.
    [[nodiscard]] static std::size_t
    frequency(const SegmentSequence& segments, std::string_view id);
};

} // namespace dramanet::centrality
