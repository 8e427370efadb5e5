/// @file src/ranking/rank_aggregator.cpp
/// @brief Dense ranking, composite centrality and central-character choice.

#include "dramanet/ranking.hpp"
#include "dramanet/constants.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <utility>

namespace dramanet::ranking {

// ─── CharacterChoice ──────────────────────────────────────────────────────────

CharacterChoice CharacterChoice::single(CharacterId id) {
    return CharacterChoice(Kind::Single, {std::move(id)});
}

CharacterChoice CharacterChoice::tied(std::vector<CharacterId> candidates) {
    return CharacterChoice(Kind::Tied, std::move(candidates));
}

CharacterChoice CharacterChoice::none() {
    return CharacterChoice(Kind::None, {});
}

std::optional<CharacterId> CharacterChoice::id() const {
    if (kind_ != Kind::Single) return std::nullopt;
    return candidates_.front();
}

std::string CharacterChoice::to_string() const {
    switch (kind_) {
        case Kind::Single: return candidates_.front();
        case Kind::Tied:   return std::string(constants::SEVERAL_SENTINEL);
        case Kind::None:   break;
    }
    return std::string(constants::UNDEFINED_SENTINEL);
}

// ─── dense_rank ───────────────────────────────────────────────────────────────

bool same_value(double a, double b) noexcept {
    const double scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= constants::RANK_TIE_TOLERANCE * scale;
}

std::vector<std::size_t> dense_rank(std::span<const double> values) {
    std::vector<std::size_t> order;
    order.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isnan(values[i])) order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(),
        [&values](std::size_t a, std::size_t b) { return values[a] > values[b]; });

    // Walk in descending order; a new rank starts wherever the value moves
    // beyond tolerance of its predecessor.
    std::vector<std::size_t> ranks(values.size(), 0);
    std::size_t rank = 0;
    for (std::size_t k = 0; k < order.size(); ++k) {
        if (k == 0 || !same_value(values[order[k - 1]], values[order[k]])) ++rank;
        ranks[order[k]] = rank;
    }
    return ranks;
}

// ─── RankAggregator::rank ─────────────────────────────────────────────────────

namespace {

template <typename Field>
std::vector<double> column(const std::vector<centrality::CharacterMetrics>& rows,
                           Field field) {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(static_cast<double>(std::invoke(field, row)));
    }
    return out;
}

/// 15 × central_score, exact in integers: the average of five columns, one
/// of which is itself a third of three others, has denominator 15.
std::size_t central_key(const centrality::CharacterMetrics& row) noexcept {
    const std::size_t structural = row.degree_rank + row.closeness_rank
                                 + row.betweenness_rank;
    return 4 * structural + 3 * row.frequency_rank;
}

} // anonymous namespace

centrality::CharacterMetricsTable
RankAggregator::rank(const centrality::CharacterMetricsTable& table) {
    std::vector<centrality::CharacterMetrics> rows = table.rows();

    const auto degree      = dense_rank(column(rows, &centrality::CharacterMetrics::degree));
    const auto closeness   = dense_rank(column(rows, &centrality::CharacterMetrics::closeness));
    const auto betweenness = dense_rank(column(rows, &centrality::CharacterMetrics::betweenness));
    const auto frequency   = dense_rank(column(rows, &centrality::CharacterMetrics::frequency));

    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto& row = rows[i];
        row.degree_rank      = degree[i];
        row.closeness_rank   = closeness[i];
        row.betweenness_rank = betweenness[i];
        row.frequency_rank   = frequency[i];

        row.avg_centrality_rank = static_cast<double>(row.degree_rank
                                                      + row.closeness_rank
                                                      + row.betweenness_rank) / 3.0;
        row.composite_centrality =
            (static_cast<double>(row.frequency_rank) + row.avg_centrality_rank) / 2.0;
    }
    return centrality::CharacterMetricsTable(std::move(rows));
}

// ─── RankAggregator::central_character ────────────────────────────────────────

double RankAggregator::central_score(const centrality::CharacterMetrics& row) noexcept {
    return static_cast<double>(central_key(row)) / 15.0;
}

CentralCharacter
RankAggregator::central_character(const centrality::CharacterMetricsTable& table) {
    if (table.empty()) return CentralCharacter::none();

    const auto& rows = table.rows();
    std::size_t best = std::numeric_limits<std::size_t>::max();
    for (const auto& row : rows) {
        best = std::min(best, central_key(row));
    }

    std::vector<CharacterId> winners;
    for (const auto& row : rows) {
        if (central_key(row) == best) winners.push_back(row.id);
    }

    if (winners.size() == 1) return CentralCharacter::single(std::move(winners.front()));
    return CentralCharacter::tied(std::move(winners));
}

// ─── RankAggregator::top_ranked ───────────────────────────────────────────────

namespace {

template <typename Field>
CharacterChoice top_of(const std::vector<centrality::CharacterMetrics>& rows,
                       Field metric, TopRankPolicy policy) {
    const auto values = column(rows, metric);
    const auto match  = policy == TopRankPolicy::ClosenessColumn
                          ? column(rows, &centrality::CharacterMetrics::closeness)
                          : values;

    std::vector<CharacterId> holders;
    if (!values.empty()) {
        const double peak = *std::max_element(values.begin(), values.end());
        for (std::size_t i = 0; i < rows.size(); ++i) {
            if (same_value(match[i], peak)) holders.push_back(rows[i].id);
        }
    }

    if (holders.size() == 1) return CharacterChoice::single(std::move(holders.front()));
    return CharacterChoice::tied(std::move(holders));
}

} // anonymous namespace

TopRanked RankAggregator::top_ranked(const centrality::CharacterMetricsTable& table,
                                     TopRankPolicy policy) {
    const auto& rows = table.rows();
    TopRanked out;
    out.degree      = top_of(rows, &centrality::CharacterMetrics::degree, policy);
    out.closeness   = top_of(rows, &centrality::CharacterMetrics::closeness, policy);
    out.betweenness = top_of(rows, &centrality::CharacterMetrics::betweenness, policy);
    out.frequency   = top_of(rows, &centrality::CharacterMetrics::frequency, policy);
    out.central     = central_character(table);
    return out;
}

} // namespace dramanet::ranking
