/// @file src/temporal/temporal_analyzer.cpp
/// @brief Change rates, all-in index and entry/exit timing.

#include "dramanet/temporal.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace dramanet::temporal {

// ─── Change rate ──────────────────────────────────────────────────────────────

double TemporalAnalyzer::change_rate(const Segment& s, const Segment& t) {
    // Both sets are sorted: count the intersection in one merge pass.
    std::size_t shared = 0;
    auto a = s.begin();
    auto b = t.begin();
    while (a != s.end() && b != t.end()) {
        if (*a < *b)      ++a;
        else if (*b < *a) ++b;
        else { ++shared; ++a; ++b; }
    }

    const std::size_t united = s.size() + t.size() - shared;
    if (united == 0) return 0.0;  // two empty segments are identical

    const std::size_t differing = united - shared;
    return static_cast<double>(differing) / static_cast<double>(united);
}

std::vector<double> TemporalAnalyzer::change_rates(const SegmentSequence& segments) {
    std::vector<double> rates;
    if (segments.size() < 2) return rates;

    rates.reserve(segments.size() - 1);
    for (std::size_t i = 1; i < segments.size(); ++i) {
        rates.push_back(change_rate(segments[i - 1], segments[i]));
    }
    return rates;
}

// ─── All-in index ─────────────────────────────────────────────────────────────

Measure TemporalAnalyzer::all_in_index(const SegmentSequence& segments,
                                       const std::set<CharacterId>& universe) {
    if (segments.empty()) return Measure::undefined(UndefinedReason::EmptySequence);

    std::set<CharacterId> appeared;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        for (const auto& id : segments[i]) {
            if (universe.count(id) > 0) appeared.insert(id);
        }
        if (appeared.size() == universe.size()) {
            return Measure::defined(static_cast<double>(i + 1)
                                    / static_cast<double>(segments.size()));
        }
    }
    return Measure::undefined(UndefinedReason::UniverseNeverComplete);
}

// ─── Final scene size ─────────────────────────────────────────────────────────

Measure TemporalAnalyzer::final_scene_size_index(const SegmentSequence& segments,
                                                 std::size_t universe_size) noexcept {
    if (segments.empty())   return Measure::undefined(UndefinedReason::EmptySequence);
    if (universe_size == 0) return Measure::undefined(UndefinedReason::EmptyUniverse);
    return Measure::defined(static_cast<double>(segments.back().size())
                            / static_cast<double>(universe_size));
}

// ─── Central character entry ──────────────────────────────────────────────────

Measure
TemporalAnalyzer::central_character_entry_index(const SegmentSequence& segments,
                                                const ranking::CentralCharacter& central) {
    if (segments.empty()) return Measure::undefined(UndefinedReason::EmptySequence);

    switch (central.kind()) {
        case ranking::CharacterChoice::Kind::Tied:
            return Measure::undefined(UndefinedReason::CentralCharacterTied);
        case ranking::CharacterChoice::Kind::None:
            return Measure::undefined(UndefinedReason::NoCentralCharacter);
        case ranking::CharacterChoice::Kind::Single:
            break;
    }

    const CharacterId& id = central.candidates().front();
    const auto it = std::find_if(segments.begin(), segments.end(),
        [&id](const Segment& s) { return s.count(id) > 0; });
    if (it == segments.end()) {
        return Measure::undefined(UndefinedReason::CharacterNeverAppears);
    }

    const auto position = static_cast<double>(std::distance(segments.begin(), it) + 1);
    return Measure::defined(position / static_cast<double>(segments.size()));
}

// ─── Characters last in ───────────────────────────────────────────────────────

std::string TemporalAnalyzer::characters_last_in(const SegmentSequence& segments) {
    std::string out;
    if (segments.empty()) return out;

    for (const auto& id : segments.back()) {
        if (!out.empty()) out += ',';
        out += id;
    }
    return out;
}

// ─── analyze ──────────────────────────────────────────────────────────────────

TemporalDynamics TemporalAnalyzer::analyze(const PlayRecord& play,
                                           const ranking::CentralCharacter& central) {
    const auto& segments = play.segments;
    const std::size_t universe_size = play.universe.size();

    TemporalDynamics out;
    out.change_rates = change_rates(segments);

    if (!out.change_rates.empty()) {
        const auto n = static_cast<double>(out.change_rates.size());
        const double mean = std::accumulate(out.change_rates.begin(),
                                            out.change_rates.end(), 0.0) / n;
        double sq_sum = 0.0;
        for (double r : out.change_rates) {
            const double d = r - mean;
            sq_sum += d * d;
        }
        out.change_rate_mean = Measure::defined(mean);
        out.change_rate_std  = Measure::defined(std::sqrt(sq_sum / n));
    } else if (segments.empty()) {
        out.change_rate_mean = Measure::undefined(UndefinedReason::EmptySequence);
        out.change_rate_std  = Measure::undefined(UndefinedReason::EmptySequence);
    }

    out.all_in_index                  = all_in_index(segments, play.universe);
    out.final_scene_size_index        = final_scene_size_index(segments, universe_size);
    out.central_character_entry_index = central_character_entry_index(segments, central);
    out.characters_last_in            = characters_last_in(segments);
    return out;
}

} // namespace dramanet::temporal
