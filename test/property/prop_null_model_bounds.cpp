/**
 * @file  prop_null_model_bounds.cpp
 * @brief Property: G(n, e) draws and their baseline stay within range
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_null_model_bounds
 *
 *   |E(G(n,e))| = min(e, n(n−1)/2)
 *   0 ≤ randcluster ≤ 1
 *   1 ≤ randavgpathl ≤ n − 1   (n ≥ 2, when defined)
 *   path_length_successes + exhausted_samples = iterations
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>

#include "dramanet/null_model.hpp"

using namespace dramanet::null_model;

int main() {
    bool ok = true;

    ok &= rc::check(
        "gnm_random_graph: exact edge count, no self-loops",
        [] {
            const auto n    = *rc::gen::inRange<std::size_t>(0, 15);
            const auto e    = *rc::gen::inRange<std::size_t>(0, 120);
            const auto seed = *rc::gen::arbitrary<std::uint64_t>();

            std::mt19937_64 rng(seed);
            const auto adj = gnm_random_graph(n, e, rng);

            std::size_t twice = 0;
            for (std::size_t u = 0; u < adj.size(); ++u) {
                for (auto v : adj[u]) RC_ASSERT(v != u);
                twice += adj[u].size();
            }
            const std::size_t max_edges = n < 2 ? 0 : n * (n - 1) / 2;
            RC_ASSERT(twice / 2 == std::min(e, max_edges));
        }
    );

    ok &= rc::check(
        "null_model: baseline values bounded, samples accounted for",
        [] {
            const auto n          = *rc::gen::inRange<std::size_t>(0, 10);
            const auto max_edges  = n < 2 ? std::size_t{0} : n * (n - 1) / 2;
            const auto e          = *rc::gen::inRange<std::size_t>(0, max_edges + 1);
            const auto iterations = *rc::gen::inRange<std::size_t>(1, 8);

            SamplerConfig cfg;
            cfg.seed = *rc::gen::arbitrary<std::uint64_t>();
            cfg.path_length_attempts = 5;
            NullModelSampler sampler(cfg);
            const auto b = sampler.sample(n, e, iterations);

            RC_ASSERT(b.path_length_successes + b.exhausted_samples == iterations);
            if (b.randcluster.is_defined()) {
                RC_ASSERT(b.randcluster.value() >= 0.0);
                RC_ASSERT(b.randcluster.value() <= 1.0);
            }
            if (n >= 2 && b.randavgpathl.is_defined()) {
                RC_ASSERT(b.randavgpathl.value() >= 1.0);
                RC_ASSERT(b.randavgpathl.value() <= static_cast<double>(n - 1));
            }
        }
    );

    return ok ? 0 : 1;
}
