/// @file src/core/report.cpp
/// @brief `;`-separated text renderings of analysis results.

#include "dramanet/report.hpp"
#include "dramanet/constants.hpp"

#include <fmt/format.h>

#include <iterator>

namespace dramanet::core::report {

namespace {

[[nodiscard]] std::string format_year(const std::optional<int>& year) {
    return year ? fmt::format("{}", *year) : std::string(constants::UNDEFINED_SENTINEL);
}

} // anonymous namespace

std::string format_measure(const Measure& m) {
    if (!m.is_defined()) return std::string(constants::UNDEFINED_SENTINEL);
    return fmt::format("{}", m.value());
}

// ─── Per-play ─────────────────────────────────────────────────────────────────

std::string summary(const PlayAnalysis& analysis) {
    const auto& s = analysis.summary;
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "ID;{}\n", s.id);
    fmt::format_to(out, "title;{}\n", s.metadata.title);
    fmt::format_to(out, "author;{}\n", s.metadata.author);
    fmt::format_to(out, "year;{}\n", format_year(s.metadata.definite_year()));
    fmt::format_to(out, "segment_count;{}\n", s.segment_count);
    fmt::format_to(out, "count_type;{}\n", s.metadata.count_type);
    fmt::format_to(out, "charcount;{}\n", s.graph.charcount);
    fmt::format_to(out, "edgecount;{}\n", s.graph.edgecount);
    fmt::format_to(out, "maxdegree;{}\n", format_measure(s.graph.maxdegree));
    fmt::format_to(out, "avgdegree;{}\n", format_measure(s.graph.avgdegree));
    fmt::format_to(out, "density;{}\n", format_measure(s.graph.density));
    fmt::format_to(out, "avgpathlength;{}\n", format_measure(s.graph.avgpathlength));
    fmt::format_to(out, "clustering_coefficient;{}\n",
                   format_measure(s.graph.clustering_coefficient));
    fmt::format_to(out, "connected_components;{}\n", s.graph.connected_components);
    fmt::format_to(out, "randavgpathl;{}\n", format_measure(s.baseline.randavgpathl));
    fmt::format_to(out, "randcluster;{}\n", format_measure(s.baseline.randcluster));
    fmt::format_to(out, "all_in_index;{}\n", format_measure(s.temporal.all_in_index));
    fmt::format_to(out, "change_rate_mean;{}\n", format_measure(s.temporal.change_rate_mean));
    fmt::format_to(out, "change_rate_std;{}\n", format_measure(s.temporal.change_rate_std));
    fmt::format_to(out, "final_scene_size_index;{}\n",
                   format_measure(s.temporal.final_scene_size_index));
    fmt::format_to(out, "central_character;{}\n", s.central_character.to_string());
    fmt::format_to(out, "central_character_entry_index;{}\n",
                   format_measure(s.temporal.central_character_entry_index));
    fmt::format_to(out, "characters_last_in;{}\n", s.temporal.characters_last_in);
    return fmt::to_string(buf);
}

std::string character_table(const centrality::CharacterMetricsTable& table) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "name;frequency;degree;betweenness;closeness;"
                        "degree_rank;closeness_rank;betweenness_rank;frequency_rank;"
                        "avg_centrality_rank;composite_centrality\n");
    for (const auto& r : table.rows()) {
        fmt::format_to(out, "{};{};{};{};{};{};{};{};{};{};{}\n",
                       r.id, r.frequency, r.degree, r.betweenness, r.closeness,
                       r.degree_rank, r.closeness_rank, r.betweenness_rank,
                       r.frequency_rank, r.avg_centrality_rank, r.composite_centrality);
    }
    return fmt::to_string(buf);
}

std::string edge_list(const graph::InteractionGraph& g) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "source;target;weight\n");
    for (const auto& e : g.edges()) {
        fmt::format_to(out, "{};{};{}\n", e.source, e.target, e.weight);
    }
    return fmt::to_string(buf);
}

std::string change_rates(const std::vector<double>& rates) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "segment;change_rate\n");
    for (std::size_t i = 0; i < rates.size(); ++i) {
        fmt::format_to(out, "{};{}\n", i + 1, rates[i]);
    }
    return fmt::to_string(buf);
}

// ─── Corpus ───────────────────────────────────────────────────────────────────

std::string corpus_metrics(std::span<const PlayAnalysis> analyses) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out,
        "ID;author;title;subtitle;year;genretitle;charcount;edgecount;maxdegree;"
        "avgdegree;clustering_coefficient;clustering_coefficient_random;avgpathlength;"
        "average_path_length_random;density;segment_count;count_type;all_in_index;"
        "central_character_entry_index;change_rate_mean;change_rate_std;"
        "final_scene_size_index;central_character;characters_last_in;"
        "connected_components\n");

    for (const auto& a : analyses) {
        const auto& s = a.summary;
        fmt::format_to(out, "{};{};{};{};{};{};", s.id, s.metadata.author,
                       s.metadata.title, s.metadata.subtitle,
                       format_year(s.metadata.definite_year()), s.metadata.genre_title);
        fmt::format_to(out, "{};{};{};{};{};{};{};{};{};",
                       s.graph.charcount, s.graph.edgecount,
                       format_measure(s.graph.maxdegree), format_measure(s.graph.avgdegree),
                       format_measure(s.graph.clustering_coefficient),
                       format_measure(s.baseline.randcluster),
                       format_measure(s.graph.avgpathlength),
                       format_measure(s.baseline.randavgpathl),
                       format_measure(s.graph.density));
        fmt::format_to(out, "{};{};{};{};{};{};{};{};{};{}\n",
                       s.segment_count, s.metadata.count_type,
                       format_measure(s.temporal.all_in_index),
                       format_measure(s.temporal.central_character_entry_index),
                       format_measure(s.temporal.change_rate_mean),
                       format_measure(s.temporal.change_rate_std),
                       format_measure(s.temporal.final_scene_size_index),
                       s.central_character.to_string(), s.temporal.characters_last_in,
                       s.graph.connected_components);
    }
    return fmt::to_string(buf);
}

std::string central_characters(std::span<const PlayAnalysis> analyses) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "ID;author;title;year;frequency;degree;betweenness;closeness;central\n");
    for (const auto& a : analyses) {
        const auto& s = a.summary;
        const auto& top = a.top_ranked;
        fmt::format_to(out, "{};{};{};{};{};{};{};{};{}\n",
                       s.id, s.metadata.author, s.metadata.title,
                       format_year(s.metadata.definite_year()),
                       top.frequency.to_string(), top.degree.to_string(),
                       top.betweenness.to_string(), top.closeness.to_string(),
                       top.central.to_string());
    }
    return fmt::to_string(buf);
}

} // namespace dramanet::core::report
