/// @file src/graph/graph_builder.cpp
/// @brief InteractionGraph storage and the bipartite-projection builder.

#include "dramanet/graph.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace dramanet::graph {

// ─── InteractionGraph ─────────────────────────────────────────────────────────

InteractionGraph::InteractionGraph(std::vector<CharacterId> nodes,
                                   WeightMatrix weights)
    : nodes_(std::move(nodes))
    , weights_(std::move(weights))
    , adjacency_(nodes_.size())
{
    const auto n = static_cast<Eigen::Index>(nodes_.size());
    if (weights_.rows() != n || weights_.cols() != n) {
        // Shape mismatch: keep the nodes, drop every edge.
        weights_ = WeightMatrix::Zero(n, n);
    }
    weights_.diagonal().setZero();

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            if (i != j && weights_(i, j) > 0) {
                adjacency_[static_cast<std::size_t>(i)].push_back(
                    static_cast<NodeIndex>(j));
                if (i < j) ++edge_count_;
            }
        }
    }
}

std::optional<NodeIndex>
InteractionGraph::index_of(std::string_view id) const noexcept {
    // nodes_ is sorted: binary search.
    const auto it = std::lower_bound(nodes_.begin(), nodes_.end(), id,
        [](const CharacterId& node, std::string_view key) { return node < key; });
    if (it == nodes_.end() || *it != id) {
        return std::nullopt;
    }
    return static_cast<NodeIndex>(std::distance(nodes_.begin(), it));
}

int InteractionGraph::weight(NodeIndex a, NodeIndex b) const noexcept {
    if (a >= nodes_.size() || b >= nodes_.size() || a == b) return 0;
    return weights_(static_cast<Eigen::Index>(a), static_cast<Eigen::Index>(b));
}

std::optional<int>
InteractionGraph::weight(std::string_view a, std::string_view b) const noexcept {
    const auto ia = index_of(a);
    const auto ib = index_of(b);
    if (!ia || !ib) return std::nullopt;
    return weight(*ia, *ib);
}

std::vector<WeightedEdge> InteractionGraph::edges() const {
    std::vector<WeightedEdge> out;
    out.reserve(edge_count_);
    for (NodeIndex u = 0; u < adjacency_.size(); ++u) {
        for (NodeIndex v : adjacency_[u]) {
            if (u < v) {
                out.push_back(WeightedEdge{
                    .source = nodes_[u],
                    .target = nodes_[v],
                    .weight = weight(u, v),
                });
            }
        }
    }
    return out;
}

// ─── GraphBuilder ─────────────────────────────────────────────────────────────

std::vector<CharacterId>
GraphBuilder::appearing_characters(const SegmentSequence& segments) {
    std::set<CharacterId> seen;
    for (const auto& segment : segments) {
        seen.insert(segment.begin(), segment.end());
    }
    return {seen.begin(), seen.end()};
}

Eigen::MatrixXi
GraphBuilder::incidence_matrix(const SegmentSequence& segments,
                               const std::vector<CharacterId>& characters) {
    const auto rows = static_cast<Eigen::Index>(segments.size());
    const auto cols = static_cast<Eigen::Index>(characters.size());
    Eigen::MatrixXi b = Eigen::MatrixXi::Zero(rows, cols);

    for (Eigen::Index s = 0; s < rows; ++s) {
        for (const auto& id : segments[static_cast<std::size_t>(s)]) {
            const auto it = std::lower_bound(characters.begin(), characters.end(), id);
            if (it != characters.end() && *it == id) {
                b(s, static_cast<Eigen::Index>(std::distance(characters.begin(), it))) = 1;
            }
        }
    }
    return b;
}

InteractionGraph GraphBuilder::build(const SegmentSequence& segments) {
    auto characters = appearing_characters(segments);
    if (characters.empty()) {
        return InteractionGraph{};
    }

    const Eigen::MatrixXi b = incidence_matrix(segments, characters);

    // Project the bipartite graph onto the character side.
    WeightMatrix w = b.transpose() * b;
    w.diagonal().setZero();

    return InteractionGraph(std::move(characters), std::move(w));
}

} // namespace dramanet::graph
