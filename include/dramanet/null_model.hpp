#pragma once

/// @file include/dramanet/null_model.hpp
/// @brief Null-Model Sampler: random-graph baseline for clustering and path
///        length.
///
/// # Module: Null Model
///
/// ## Responsibility
/// Estimate the clustering coefficient and average shortest path length that
/// a uniformly random graph G(n, e) with the observed node and edge counts
/// would have, so the observed values can be read as small-world or not.
///
/// ## Procedure (per iteration)
///   1. Draw G(n, e); if its average clustering is defined, add it to the
///      clustering sum and count a success.
///   2. Independently draw fresh G(n, e) until one is connected, at most
///      `path_length_attempts` times; the first connected draw adds its
///      average path length to the path sum. If none is connected the sample
///      is exhausted and contributes nothing.
///
/// The two statistics are accumulated independently: a sample can succeed
/// at one and fail at the other.
///
/// ## Randomness
/// `std::mt19937_64`, seeded from SamplerConfig::seed when set, otherwise
/// from `std::random_device`. With a fixed seed every result is reproducible.

#include "dramanet/constants.hpp"
#include "dramanet/graph.hpp"
#include "dramanet/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace dramanet::null_model {

/// Uniform random simple graph with exactly `n` nodes and `e` edges.
///
/// If `e` is at least n(n−1)/2 the complete graph is returned.
[[nodiscard]] graph::Adjacency
gnm_random_graph(std::size_t n, std::size_t e, std::mt19937_64& rng);

/// Sampler configuration.
struct SamplerConfig {
    /// Draws allowed per sample before its path length is given up.
    std::size_t path_length_attempts = constants::PATH_LENGTH_ATTEMPTS;

    /// Fixed seed for reproducible baselines; random when unset.
    std::optional<std::uint64_t> seed;
};

/// Averages over the random graphs drawn for one play.
struct RandomBaseline {
    Measure     randcluster  = Measure::undefined(UndefinedReason::NoSuccessfulSamples);
    Measure     randavgpathl = Measure::undefined(UndefinedReason::NoSuccessfulSamples);
    std::size_t iterations            = 0;
    std::size_t clustering_successes  = 0;
    std::size_t path_length_successes = 0;
    std::size_t exhausted_samples     = 0;  ///< Samples with no connected draw
};

/// Draws G(n, e) graphs and averages their clustering and path length.
class NullModelSampler {
public:
    explicit NullModelSampler(SamplerConfig config = SamplerConfig{});

    /// Run `iterations` samples for a graph of `n` nodes and `e` edges.
    ///
    /// Never fails: statistics with no successful sample are returned as
    /// Undefined(NoSuccessfulSamples).
    [[nodiscard]] RandomBaseline
    sample(std::size_t n, std::size_t e,
           std::size_t iterations = constants::DEFAULT_RANDOMIZATION);

    [[nodiscard]] const SamplerConfig& config() const noexcept { return config_; }

private:
    SamplerConfig   config_;
    std::mt19937_64 rng_;
};

} // namespace dramanet::null_model
