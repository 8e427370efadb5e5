#pragma once

/// @file include/dramanet/report.hpp
/// @brief Text renderings of analysis results.
///
/// All tables are `;`-separated with a header row. Undefined values render
/// as `NaN`, tied character choices as `SEVERAL`. Nothing here touches the
/// filesystem; callers decide where the text goes.

#include "dramanet/analyzer.hpp"
#include "dramanet/centrality.hpp"
#include "dramanet/graph.hpp"
#include "dramanet/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace dramanet::core::report {

/// A measure's value, or "NaN".
[[nodiscard]] std::string format_measure(const Measure& m);

/// "key;value" lines for every field of the per-play summary.
[[nodiscard]] std::string summary(const PlayAnalysis& analysis);

/// One row per character: metrics, ranks, composite centrality.
[[nodiscard]] std::string character_table(const centrality::CharacterMetricsTable& table);

/// "source;target;weight" per edge.
[[nodiscard]] std::string edge_list(const graph::InteractionGraph& g);

/// "segment;change_rate" per adjacent pair, numbered from 1.
[[nodiscard]] std::string change_rates(const std::vector<double>& rates);

/// One summary row per play.
[[nodiscard]] std::string corpus_metrics(std::span<const PlayAnalysis> analyses);

/// Top-ranked character per metric and central character, one row per play.
[[nodiscard]] std::string central_characters(std::span<const PlayAnalysis> analyses);

} // namespace dramanet::core::report
