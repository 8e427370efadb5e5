#pragma once

/// @file include/dramanet/graph.hpp
/// @brief Character interaction graph and its builder.
///
/// # Module: Graph Builder
///
/// ## Responsibility
/// Turn an ordered segment sequence into an undirected, weighted, simple
/// graph of characters: two characters are linked iff they share at least
/// one segment, and the link weight is the number of segments they share.
///
/// ## Construction
/// The segments and characters form a bipartite graph, stored as the
/// incidence matrix B (one row per segment, one column per character):
///
///     B(s, c) = 1  iff character c is present in segment s
///
/// Its projection onto the character side is
///
///     W = Bᵀ · B,   W(u, v) = |{ s : u ∈ s ∧ v ∈ s }|
///
/// whose off-diagonal entries are exactly the co-occurrence weights. The
/// diagonal (per-character frequency) is cleared so the graph has no
/// self-loops.
///
/// ## Guarantees
/// - Characters that appear in no segment are not nodes
/// - Nodes are indexed in lexicographic id order
/// - Immutable after construction; all accessors are const
///
/// ## NOT Responsible For
/// - Graph statistics (see metrics.hpp, centrality.hpp)
/// - Alias resolution (see play_loader.hpp)

#include "dramanet/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace dramanet::graph {

using NodeIndex = std::size_t;

/// Neighbour lists, one per node, each sorted ascending.
using Adjacency = std::vector<std::vector<NodeIndex>>;

/// Symmetric co-occurrence matrix; zero diagonal.
using WeightMatrix = Eigen::MatrixXi;

/// One undirected edge with its co-occurrence count.
struct WeightedEdge {
    CharacterId source;  ///< Lexicographically smaller endpoint
    CharacterId target;
    int         weight;  ///< Number of shared segments, ≥ 1
};

// ─── InteractionGraph ─────────────────────────────────────────────────────────

/// Undirected weighted graph of co-occurring characters.
class InteractionGraph {
public:
    /// The empty graph.
    InteractionGraph() = default;

    /// Take ownership of node ids and their weight matrix.
    ///
    /// `weights` must be square with one row per node; entries ≤ 0 are
    /// treated as absent edges and the diagonal is ignored.
    InteractionGraph(std::vector<CharacterId> nodes, WeightMatrix weights);

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] const std::vector<CharacterId>& nodes() const noexcept { return nodes_; }

    /// Index of a character, or `nullopt` if it is not a node.
    [[nodiscard]] std::optional<NodeIndex> index_of(std::string_view id) const noexcept;

    /// Co-occurrence count of two nodes (0 if not adjacent).
    [[nodiscard]] int weight(NodeIndex a, NodeIndex b) const noexcept;

    /// Co-occurrence count by id. `nullopt` if either id is not a node.
    [[nodiscard]] std::optional<int>
    weight(std::string_view a, std::string_view b) const noexcept;

    [[nodiscard]] std::size_t degree(NodeIndex n) const noexcept {
        return adjacency_[n].size();
    }

    [[nodiscard]] std::span<const NodeIndex> neighbors(NodeIndex n) const noexcept {
        return adjacency_[n];
    }

    [[nodiscard]] const Adjacency& adjacency() const noexcept { return adjacency_; }

    [[nodiscard]] const WeightMatrix& weights() const noexcept { return weights_; }

    /// All edges, ordered by (source index, target index).
    [[nodiscard]] std::vector<WeightedEdge> edges() const;

private:
    std::vector<CharacterId> nodes_;
    WeightMatrix             weights_;
    Adjacency                adjacency_;
    std::size_t              edge_count_ = 0;
};

// ─── GraphBuilder ─────────────────────────────────────────────────────────────

/// Stateless builder for InteractionGraph.
class GraphBuilder {
public:
    /// Characters present in at least one segment, sorted by id.
    [[nodiscard]] static std::vector<CharacterId>
    appearing_characters(const SegmentSequence& segments);

    /// Segment × character incidence matrix over `characters`.
    ///
    /// Ids missing from `characters` are ignored.
    [[nodiscard]] static Eigen::MatrixXi
    incidence_matrix(const SegmentSequence& segments,
                     const std::vector<CharacterId>& characters);

    /// Build the projected co-occurrence graph. Never fails; an empty
    /// sequence gives the empty graph.
    [[nodiscard]] static InteractionGraph build(const SegmentSequence& segments);
};

} // namespace dramanet::graph
