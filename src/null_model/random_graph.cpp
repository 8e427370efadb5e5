/// @file src/null_model/random_graph.cpp
/// @brief G(n, e) random graph generator.

#include "dramanet/null_model.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace dramanet::null_model {

graph::Adjacency gnm_random_graph(std::size_t n, std::size_t e, std::mt19937_64& rng) {
    graph::Adjacency adj(n);
    if (n < 2) return adj;

    const std::size_t max_edges = n * (n - 1) / 2;

    if (e >= max_edges) {
        for (graph::NodeIndex u = 0; u < n; ++u) {
            for (graph::NodeIndex v = 0; v < n; ++v) {
                if (u != v) adj[u].push_back(v);
            }
        }
        return adj;
    }

    // Rejection sampling of distinct node pairs; e < max_edges here.
    std::uniform_int_distribution<graph::NodeIndex> pick(0, n - 1);
    std::set<std::pair<graph::NodeIndex, graph::NodeIndex>> chosen;
    while (chosen.size() < e) {
        graph::NodeIndex u = pick(rng);
        graph::NodeIndex v = pick(rng);
        if (u == v) continue;
        if (u > v) std::swap(u, v);
        if (chosen.emplace(u, v).second) {
            adj[u].push_back(v);
            adj[v].push_back(u);
        }
    }

    for (auto& nbrs : adj) {
        std::sort(nbrs.begin(), nbrs.end());
    }
    return adj;
}

} // namespace dramanet::null_model
