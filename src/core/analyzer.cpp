/// @file src/core/analyzer.cpp
/// @brief PlayAnalyzer: per-play pipeline.

#include "dramanet/analyzer.hpp"

#include <set>

namespace dramanet::core {

PlayAnalyzer::PlayAnalyzer(AnalysisConfig config)
    : config_(std::move(config))
    , sampler_(config_.sampler)
{}

void PlayAnalyzer::report_undefined(DiagnosticLog& log, std::string_view play_id,
                                    std::string_view field, const Measure& m) {
    if (const auto reason = m.reason()) {
        log.error(play_id, "{} undefined ({})", field, to_string(*reason));
    }
}

namespace {

/// Ids that occur in some segment but not in the declared cast.
[[nodiscard]] std::set<CharacterId> undeclared_characters(const PlayRecord& play) {
    std::set<CharacterId> stray;
    for (const auto& segment : play.segments) {
        for (const auto& id : segment) {
            if (play.universe.count(id) == 0) stray.insert(id);
        }
    }
    return stray;
}

} // anonymous namespace

PlayAnalysis PlayAnalyzer::analyze(const PlayRecord& play) {
    DiagnosticLog log(config_.verbose);

    const auto stray = undeclared_characters(play);
    if (stray.empty()) return run(play, log);

    PlayRecord amended = play;
    for (const auto& id : stray) {
        log.warn(play.id, "character '{}' appears but is not declared; adding to the cast", id);
        amended.universe.insert(id);
    }
    return run(amended, log);
}

PlayAnalysis PlayAnalyzer::run(const PlayRecord& play, DiagnosticLog& log) {
    PlayAnalysis out;

    // ── Step 1: Interaction graph ────────────────────────────────────────────
    out.graph = graph::GraphBuilder::build(play.segments);
    log.info(play.id, "{} segments, {} characters on stage of {} declared, {} edges",
             play.segments.size(), out.graph.node_count(), play.universe.size(),
             out.graph.edge_count());

    // ── Step 2: Whole-graph metrics ──────────────────────────────────────────
    auto& summary = out.summary;
    summary.id            = play.id;
    summary.metadata      = play.metadata;
    summary.segment_count = play.segments.size();
    summary.graph         = metrics::GraphMetricsEngine::compute(out.graph);

    if (summary.graph.path_length_fallback) {
        log.error(play.id, "graph is not connected ({} components); "
                  "avgpathlength taken from the largest component",
                  summary.graph.connected_components);
    }
    report_undefined(log, play.id, "maxdegree", summary.graph.maxdegree);
    report_undefined(log, play.id, "avgdegree", summary.graph.avgdegree);
    report_undefined(log, play.id, "density", summary.graph.density);
    report_undefined(log, play.id, "avgpathlength", summary.graph.avgpathlength);
    report_undefined(log, play.id, "clustering_coefficient",
                     summary.graph.clustering_coefficient);

    // ── Step 3: Per-character metrics and ranks ──────────────────────────────
    out.characters = ranking::RankAggregator::rank(
        centrality::CentralityEngine::compute(out.graph, play.segments));
    out.top_ranked = ranking::RankAggregator::top_ranked(out.characters,
                                                         config_.top_rank_policy);
    summary.central_character = out.top_ranked.central;
    if (summary.central_character.kind() == ranking::CharacterChoice::Kind::Tied) {
        log.info(play.id, "{} characters share the central position",
                 summary.central_character.candidates().size());
    }

    // ── Step 4: Random baseline ──────────────────────────────────────────────
    const std::size_t iterations = summary.graph.path_length_fallback
                                     ? config_.fallback_randomization
                                     : config_.randomization;
    summary.baseline = sampler_.sample(summary.graph.charcount,
                                       summary.graph.edgecount, iterations);
    if (summary.baseline.exhausted_samples > 0) {
        log.warn(play.id, "{} of {} random samples found no connected graph in {} draws",
                 summary.baseline.exhausted_samples, iterations,
                 sampler_.config().path_length_attempts);
    }
    report_undefined(log, play.id, "randavgpathl", summary.baseline.randavgpathl);
    report_undefined(log, play.id, "randcluster", summary.baseline.randcluster);

    // ── Step 5: Temporal dynamics ────────────────────────────────────────────
    summary.temporal = temporal::TemporalAnalyzer::analyze(play, summary.central_character);
    report_undefined(log, play.id, "all_in_index", summary.temporal.all_in_index);
    report_undefined(log, play.id, "change_rate_mean", summary.temporal.change_rate_mean);
    report_undefined(log, play.id, "change_rate_std", summary.temporal.change_rate_std);
    report_undefined(log, play.id, "final_scene_size_index",
                     summary.temporal.final_scene_size_index);
    report_undefined(log, play.id, "central_character_entry_index",
                     summary.temporal.central_character_entry_index);

    out.diagnostics = log.take();
    return out;
}

} // namespace dramanet::core
