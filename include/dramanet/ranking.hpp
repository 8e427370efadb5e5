#pragma once

/// @file include/dramanet/ranking.hpp
/// @brief Rank Aggregator: dense ranks, composite centrality and the central
///        character decision.
///
/// # Module: Ranking
///
/// ## Dense rank
/// Values are ranked in descending order; equal values share a rank and the
/// next distinct value gets the next integer, so ranks index distinct values
/// rather than row positions:
///
///     values  [5, 3, 5, 1]   →   ranks [1, 2, 1, 3]
///
/// ## Derived fields
///   avg_centrality_rank  = (degree_rank + closeness_rank + betweenness_rank) / 3
///   composite_centrality = (frequency_rank + avg_centrality_rank) / 2
///
/// ## Central character
/// The character with the lowest mean over all five rank-valued columns
/// (the four base ranks plus avg_centrality_rank). Because the structural
/// ranks also enter through their own average, they weigh more than
/// frequency; the formula is kept as is. A shared minimum yields a tie.
///
/// ## Top-ranked per metric
/// For each of degree, closeness, betweenness and frequency: the maximum of
/// the metric's value column, matched against a value column to find the
/// holder. TopRankPolicy::ClosenessColumn (the default) matches every
/// metric's maximum against the closeness column; OwnColumn matches against
/// the metric's own column. Values are matched with same_value(). Anything
/// but exactly one holder is reported as SEVERAL.

#include "dramanet/centrality.hpp"
#include "dramanet/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dramanet::ranking {

// ─── CharacterChoice ──────────────────────────────────────────────────────────

/// Outcome of picking one character: a single id, a tie, or nobody at all.
class CharacterChoice {
public:
    enum class Kind {
        Single,  ///< Exactly one character
        Tied,    ///< Zero or several candidates matched; rendered SEVERAL
        None,    ///< Nothing to choose from (empty table)
    };

    [[nodiscard]] static CharacterChoice single(CharacterId id);
    [[nodiscard]] static CharacterChoice tied(std::vector<CharacterId> candidates);
    [[nodiscard]] static CharacterChoice none();

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_single() const noexcept { return kind_ == Kind::Single; }

    /// The chosen id, or `nullopt` unless Single.
    [[nodiscard]] std::optional<CharacterId> id() const;

    /// Every character that matched (one for Single, any number for Tied).
    [[nodiscard]] const std::vector<CharacterId>& candidates() const noexcept {
        return candidates_;
    }

    /// The id, "SEVERAL" for a tie, "NaN" for none.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const CharacterChoice&) const = default;

private:
    CharacterChoice(Kind kind, std::vector<CharacterId> candidates)
        : kind_(kind), candidates_(std::move(candidates)) {}

    Kind                     kind_;
    std::vector<CharacterId> candidates_;
};

using CentralCharacter = CharacterChoice;

/// How top_ranked() finds the holder of each metric's maximum.
enum class TopRankPolicy {
    ClosenessColumn,  ///< Match against closeness for every metric
    OwnColumn,        ///< Match against the metric's own column
};

/// Top character per metric, plus the central character.
struct TopRanked {
    CharacterChoice degree      = CharacterChoice::none();
    CharacterChoice closeness   = CharacterChoice::none();
    CharacterChoice betweenness = CharacterChoice::none();
    CharacterChoice frequency   = CharacterChoice::none();
    CharacterChoice central     = CharacterChoice::none();
};

// ─── Dense rank ───────────────────────────────────────────────────────────────

/// True if `a` and `b` agree to within constants::RANK_TIE_TOLERANCE,
/// relative to the larger magnitude (absolute below 1).
[[nodiscard]] bool same_value(double a, double b) noexcept;

/// Descending dense rank of `values` (1 = highest).
///
/// Values that are same_value() as their neighbour in sorted order share a
/// rank. NaN entries are left unranked (rank 0) and do not consume a rank.
[[nodiscard]] std::vector<std::size_t> dense_rank(std::span<const double> values);

// ─── RankAggregator ───────────────────────────────────────────────────────────

/// Stateless rank aggregation over a CharacterMetricsTable.
class RankAggregator {
public:
    /// A copy of `table` with every rank and derived field filled in.
    [[nodiscard]] static centrality::CharacterMetricsTable
    rank(const centrality::CharacterMetricsTable& table);

    /// Mean of the five rank-valued columns of one row.
    [[nodiscard]] static double central_score(const centrality::CharacterMetrics& row) noexcept;

    /// Character with the unique lowest central_score.
    /// `table` must already be ranked.
    [[nodiscard]] static CentralCharacter
    central_character(const centrality::CharacterMetricsTable& table);

    /// Top character for each metric. `table` must already be ranked.
    [[nodiscard]] static TopRanked
    top_ranked(const centrality::CharacterMetricsTable& table,
               TopRankPolicy policy = TopRankPolicy::ClosenessColumn);
};

} // namespace dramanet::ranking
