/// @file src/null_model/null_model_sampler.cpp
/// @brief NullModelSampler: clustering and path-length averages over G(n, e).

#include "dramanet/null_model.hpp"
#include "dramanet/graph_algorithms.hpp"

#include <utility>

namespace dramanet::null_model {

namespace {

[[nodiscard]] std::mt19937_64 make_engine(const std::optional<std::uint64_t>& seed) {
    if (seed) return std::mt19937_64(*seed);
    std::random_device rd;
    return std::mt19937_64((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

} // anonymous namespace

NullModelSampler::NullModelSampler(SamplerConfig config)
    : config_(std::move(config))
    , rng_(make_engine(config_.seed))
{}

RandomBaseline NullModelSampler::sample(std::size_t n, std::size_t e,
                                        std::size_t iterations) {
    RandomBaseline out;
    out.iterations = iterations;

    double cluster_sum = 0.0;
    double path_sum    = 0.0;

    for (std::size_t i = 0; i < iterations; ++i) {
        // ── Clustering: one draw, skipped when undefined ─────────────────────
        const auto r = gnm_random_graph(n, e, rng_);
        if (auto c = graph::algo::average_clustering(r)) {
            cluster_sum += *c;
            ++out.clustering_successes;
        }

        // ── Path length: fresh draws until one is connected ─────────────────
        bool sampled = false;
        for (std::size_t attempt = 0; attempt < config_.path_length_attempts; ++attempt) {
            const auto p = gnm_random_graph(n, e, rng_);
            if (auto apl = graph::algo::average_shortest_path_length(p)) {
                path_sum += *apl;
                ++out.path_length_successes;
                sampled = true;
                break;
            }
        }
        if (!sampled) ++out.exhausted_samples;
    }

    if (out.clustering_successes > 0) {
        out.randcluster = Measure::defined(
            cluster_sum / static_cast<double>(out.clustering_successes));
    }
    if (out.path_length_successes > 0) {
        out.randavgpathl = Measure::defined(
            path_sum / static_cast<double>(out.path_length_successes));
    }
    return out;
}

} // namespace dramanet::null_model
