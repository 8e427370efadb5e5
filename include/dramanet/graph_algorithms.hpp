#pragma once

/// @file include/dramanet/graph_algorithms.hpp
/// @brief Unweighted graph traversals shared by the metric engines and the
///        null-model sampler.
///
/// All functions take a plain neighbour-list `Adjacency` so that observed
/// interaction graphs and random null-model graphs go through identical
/// code. Edge weights are ignored: path lengths count hops.

#include "dramanet/graph.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace dramanet::graph::algo {

/// Distance marker for nodes not reachable from the BFS source.
static constexpr std::size_t UNREACHABLE = static_cast<std::size_t>(-1);

/// Hop distances from `source` to every node; UNREACHABLE where no path exists.
[[nodiscard]] std::vector<std::size_t>
bfs_distances(const Adjacency& adj, NodeIndex source);

/// Connected components, each sorted ascending, ordered by smallest member.
[[nodiscard]] std::vector<std::vector<NodeIndex>>
connected_components(const Adjacency& adj);

[[nodiscard]] bool is_connected(const Adjacency& adj);

/// Subgraph induced by `keep` (sorted ascending), re-indexed 0..keep.size()-1.
[[nodiscard]] Adjacency
induced_subgraph(const Adjacency& adj, const std::vector<NodeIndex>& keep);

/// Largest connected component (first one in node order among equal sizes).
/// Empty for the empty graph.
[[nodiscard]] std::vector<NodeIndex>
largest_component(const Adjacency& adj);

/// Mean hop distance over all ordered pairs of distinct nodes.
///
/// # Returns
/// 0.0 for a single node. `nullopt` for the empty graph or if any pair is
/// disconnected.
[[nodiscard]] std::optional<double>
average_shortest_path_length(const Adjacency& adj);

/// Local clustering coefficient of one node: closed triads over possible
/// triads among its neighbours; 0 for degree < 2.
[[nodiscard]] double local_clustering(const Adjacency& adj, NodeIndex n);

/// Mean local clustering coefficient over all nodes.
///
/// # Returns
/// `nullopt` for the empty graph.
[[nodiscard]] std::optional<double> average_clustering(const Adjacency& adj);

} // namespace dramanet::graph::algo
