/// @file src/centrality/centrality_engine.cpp
/// @brief Degree, Brandes betweenness, closeness and frequency per character.

#include "dramanet/centrality.hpp"
#include "dramanet/graph_algorithms.hpp"

#include <algorithm>
#include <deque>
#include <stack>

namespace dramanet::centrality {

// ─── CharacterMetricsTable ────────────────────────────────────────────────────

const CharacterMetrics*
CharacterMetricsTable::find(std::string_view id) const noexcept {
    const auto it = std::find_if(rows_.begin(), rows_.end(),
        [id](const CharacterMetrics& row) { return row.id == id; });
    return it == rows_.end() ? nullptr : &*it;
}

// ─── Betweenness ──────────────────────────────────────────────────────────────

std::vector<double> CentralityEngine::betweenness(const graph::Adjacency& adj) {
    const std::size_t n = adj.size();
    std::vector<double> cb(n, 0.0);

    // Brandes (2001): one BFS per source, then back-propagate pair
    // dependencies in order of non-increasing distance.
    std::vector<std::vector<graph::NodeIndex>> preds(n);
    std::vector<double> sigma(n);
    std::vector<double> delta(n);
    std::vector<std::size_t> dist(n);

    for (graph::NodeIndex s = 0; s < n; ++s) {
        for (graph::NodeIndex v = 0; v < n; ++v) {
            preds[v].clear();
            sigma[v] = 0.0;
            delta[v] = 0.0;
            dist[v]  = graph::algo::UNREACHABLE;
        }
        sigma[s] = 1.0;
        dist[s]  = 0;

        std::stack<graph::NodeIndex> order;
        std::deque<graph::NodeIndex> queue{s};
        while (!queue.empty()) {
            const graph::NodeIndex v = queue.front();
            queue.pop_front();
            order.push(v);
            for (graph::NodeIndex w : adj[v]) {
                if (dist[w] == graph::algo::UNREACHABLE) {
                    dist[w] = dist[v] + 1;
                    queue.push_back(w);
                }
                if (dist[w] == dist[v] + 1) {
                    sigma[w] += sigma[v];
                    preds[w].push_back(v);
                }
            }
        }

        while (!order.empty()) {
            const graph::NodeIndex w = order.top();
            order.pop();
            for (graph::NodeIndex v : preds[w]) {
                delta[v] += sigma[v] / sigma[w] * (1.0 + delta[w]);
            }
            if (w != s) cb[w] += delta[w];
        }
    }

    // Every unordered pair was counted from both ends: divide by 2, then
    // normalize by the (n−1)(n−2)/2 pairs not involving the node.
    if (n > 2) {
        const double scale = 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2));
        for (double& c : cb) c *= scale;
    }
    return cb;
}

// ─── Closeness ────────────────────────────────────────────────────────────────

std::vector<double> CentralityEngine::closeness(const graph::Adjacency& adj) {
    const std::size_t n = adj.size();
    std::vector<double> cc(n, 0.0);
    if (n <= 1) return cc;

    for (graph::NodeIndex v = 0; v < n; ++v) {
        std::size_t reachable = 0;
        double total = 0.0;
        for (std::size_t d : graph::algo::bfs_distances(adj, v)) {
            if (d == graph::algo::UNREACHABLE) continue;
            ++reachable;
            total += static_cast<double>(d);
        }
        if (total <= 0.0) continue;  // isolated node

        const double r_minus_1 = static_cast<double>(reachable - 1);
        cc[v] = (r_minus_1 / total) * (r_minus_1 / static_cast<double>(n - 1));
    }
    return cc;
}

// ─── Frequency ────────────────────────────────────────────────────────────────

std::size_t CentralityEngine::frequency(const SegmentSequence& segments,
                                        std::string_view id) {
    const CharacterId key(id);
    return static_cast<std::size_t>(std::count_if(segments.begin(), segments.end(),
        [&key](const Segment& s) { return s.count(key) > 0; }));
}

// ─── compute ──────────────────────────────────────────────────────────────────

CharacterMetricsTable
CentralityEngine::compute(const graph::InteractionGraph& g,
                          const SegmentSequence& segments) {
    const auto between = betweenness(g.adjacency());
    const auto close   = closeness(g.adjacency());

    std::vector<CharacterMetrics> rows;
    rows.reserve(g.node_count());
    for (graph::NodeIndex n = 0; n < g.node_count(); ++n) {
        CharacterMetrics row;
        row.id          = g.nodes()[n];
        row.frequency   = frequency(segments, row.id);
        row.degree      = g.degree(n);
        row.betweenness = between[n];
        row.closeness   = close[n];
        rows.push_back(std::move(row));
    }
    return CharacterMetricsTable(std::move(rows));
}

} // namespace dramanet::centrality
