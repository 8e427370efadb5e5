/// @file src/graph/graph_algorithms.cpp
/// @brief BFS-based traversals: distances, components, path length,
///        clustering.

#include "dramanet/graph_algorithms.hpp"

#include <algorithm>
#include <deque>

namespace dramanet::graph::algo {

// ─── bfs_distances ────────────────────────────────────────────────────────────

std::vector<std::size_t> bfs_distances(const Adjacency& adj, NodeIndex source) {
    std::vector<std::size_t> dist(adj.size(), UNREACHABLE);
    if (source >= adj.size()) return dist;

    std::deque<NodeIndex> queue{source};
    dist[source] = 0;
    while (!queue.empty()) {
        const NodeIndex u = queue.front();
        queue.pop_front();
        for (NodeIndex v : adj[u]) {
            if (dist[v] == UNREACHABLE) {
                dist[v] = dist[u] + 1;
                queue.push_back(v);
            }
        }
    }
    return dist;
}

// ─── Components ───────────────────────────────────────────────────────────────

std::vector<std::vector<NodeIndex>> connected_components(const Adjacency& adj) {
    std::vector<std::vector<NodeIndex>> components;
    std::vector<bool> visited(adj.size(), false);

    for (NodeIndex start = 0; start < adj.size(); ++start) {
        if (visited[start]) continue;

        std::vector<NodeIndex> component;
        std::deque<NodeIndex> queue{start};
        visited[start] = true;
        while (!queue.empty()) {
            const NodeIndex u = queue.front();
            queue.pop_front();
            component.push_back(u);
            for (NodeIndex v : adj[u]) {
                if (!visited[v]) {
                    visited[v] = true;
                    queue.push_back(v);
                }
            }
        }
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }
    return components;
}

bool is_connected(const Adjacency& adj) {
    if (adj.empty()) return false;
    const auto dist = bfs_distances(adj, 0);
    return std::none_of(dist.begin(), dist.end(),
                        [](std::size_t d) { return d == UNREACHABLE; });
}

Adjacency induced_subgraph(const Adjacency& adj, const std::vector<NodeIndex>& keep) {
    std::vector<NodeIndex> remap(adj.size(), UNREACHABLE);
    for (NodeIndex i = 0; i < keep.size(); ++i) {
        remap[keep[i]] = i;
    }

    Adjacency sub(keep.size());
    for (NodeIndex i = 0; i < keep.size(); ++i) {
        for (NodeIndex v : adj[keep[i]]) {
            if (remap[v] != UNREACHABLE) {
                sub[i].push_back(remap[v]);
            }
        }
        std::sort(sub[i].begin(), sub[i].end());
    }
    return sub;
}

std::vector<NodeIndex> largest_component(const Adjacency& adj) {
    auto components = connected_components(adj);
    if (components.empty()) return {};

    // max_element keeps the first of equally large components.
    auto it = std::max_element(components.begin(), components.end(),
        [](const auto& a, const auto& b) { return a.size() < b.size(); });
    return std::move(*it);
}

// ─── Path length ──────────────────────────────────────────────────────────────

std::optional<double> average_shortest_path_length(const Adjacency& adj) {
    const std::size_t n = adj.size();
    if (n == 0) return std::nullopt;
    if (n == 1) return 0.0;

    double total = 0.0;
    for (NodeIndex s = 0; s < n; ++s) {
        for (std::size_t d : bfs_distances(adj, s)) {
            if (d == UNREACHABLE) return std::nullopt;
            total += static_cast<double>(d);
        }
    }
    return total / static_cast<double>(n * (n - 1));
}

// ─── Clustering ───────────────────────────────────────────────────────────────

double local_clustering(const Adjacency& adj, NodeIndex n) {
    const auto& nbrs = adj[n];
    const std::size_t k = nbrs.size();
    if (k < 2) return 0.0;

    std::size_t links = 0;
    for (std::size_t i = 0; i < k; ++i) {
        const auto& ni = adj[nbrs[i]];
        for (std::size_t j = i + 1; j < k; ++j) {
            // Neighbour lists are sorted.
            if (std::binary_search(ni.begin(), ni.end(), nbrs[j])) ++links;
        }
    }
    return 2.0 * static_cast<double>(links) / static_cast<double>(k * (k - 1));
}

std::optional<double> average_clustering(const Adjacency& adj) {
    if (adj.empty()) return std::nullopt;

    double sum = 0.0;
    for (NodeIndex n = 0; n < adj.size(); ++n) {
        sum += local_clustering(adj, n);
    }
    return sum / static_cast<double>(adj.size());
}

} // namespace dramanet::graph::algo
