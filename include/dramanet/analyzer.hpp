#pragma once

/// @file include/dramanet/analyzer.hpp
/// @brief Play Analyzer: the full per-play pipeline.
///
/// # Module: Play Analyzer
///
/// ## Responsibility
/// Orchestrate the analysis of one play:
///   PlayRecord → GraphBuilder → GraphMetricsEngine + CentralityEngine →
///   RankAggregator → TemporalAnalyzer, with NullModelSampler run on the
///   graph's (node count, edge count)
///
/// ## Usage
/// ```cpp
/// PlayAnalyzer analyzer;
/// auto play = PlayLoader::load_file("emilia_galotti.play");
/// if (play) {
///     auto result = analyzer.analyze(*play);
///     fmt::print("{}", report::summary(result));
/// }
/// ```
///
/// ## Guarantees
/// - Every field of the summary is either a value or a typed undefined
/// - Each undefined field is logged once, as an error naming the play
/// - The only state is the null-model random engine; fix
///   `config.sampler.seed` for reproducible results

#include "dramanet/centrality.hpp"
#include "dramanet/constants.hpp"
#include "dramanet/diagnostics.hpp"
#include "dramanet/graph.hpp"
#include "dramanet/metrics.hpp"
#include "dramanet/null_model.hpp"
#include "dramanet/ranking.hpp"
#include "dramanet/temporal.hpp"
#include "dramanet/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dramanet::core {

// ─── AnalysisConfig ───────────────────────────────────────────────────────────

/// Configuration parameters for the play analyzer.
struct AnalysisConfig {
    /// Null-model samples per play.
    std::size_t randomization = constants::DEFAULT_RANDOMIZATION;

    /// Null-model samples once the path length needed the
    /// largest-component fallback.
    std::size_t fallback_randomization = constants::FALLBACK_RANDOMIZATION;

    /// Forwarded to the NullModelSampler.
    null_model::SamplerConfig sampler{};

    ranking::TopRankPolicy top_rank_policy = ranking::TopRankPolicy::ClosenessColumn;

    /// If true, echo diagnostics to stderr as they are logged.
    bool verbose = false;
};

// ─── GraphMetricsSummary ──────────────────────────────────────────────────────

/// One record per play: graph statistics, random baseline, temporal
/// statistics and the central character.
struct GraphMetricsSummary {
    std::string  id;
    PlayMetadata metadata;
    std::size_t  segment_count = 0;

    metrics::GraphMetrics        graph;
    null_model::RandomBaseline   baseline;
    temporal::TemporalDynamics   temporal;
    ranking::CentralCharacter    central_character = ranking::CentralCharacter::none();
};

// ─── PlayAnalysis ─────────────────────────────────────────────────────────────

/// Everything derived from one play.
struct PlayAnalysis {
    GraphMetricsSummary               summary;
    graph::InteractionGraph           graph;
    centrality::CharacterMetricsTable characters;
    ranking::TopRanked                top_ranked;
    std::vector<Diagnostic>           diagnostics;
};

// ─── PlayAnalyzer ─────────────────────────────────────────────────────────────

/// Runs the full analysis pipeline on one play at a time.
class PlayAnalyzer {
public:
    explicit PlayAnalyzer(AnalysisConfig config = AnalysisConfig{});

    /// Analyze one play. Not const: advances the null-model random engine.
    ///
    /// Segment ids missing from `play.universe` are logged as warnings and
    /// added to the cast before analysis.
    [[nodiscard]] PlayAnalysis analyze(const PlayRecord& play);

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] PlayAnalysis run(const PlayRecord& play, DiagnosticLog& log);

    /// Log `field` as an error if `m` is undefined.
    static void report_undefined(DiagnosticLog& log, std::string_view play_id,
                                 std::string_view field, const Measure& m);

    AnalysisConfig               config_;
    null_model::NullModelSampler sampler_;
};

} // namespace dramanet::core
