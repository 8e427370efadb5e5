#pragma once

/// @file include/dramanet/temporal.hpp
/// @brief Temporal Dynamics Analyzer: cast turnover and entry/exit timing
///        over the segment sequence.
///
/// # Module: Temporal Dynamics
///
/// ## Metrics (N = number of segments, U = declared universe)
///   - change rate of adjacent segments S, T:  |S Δ T| / |S ∪ T|
///     (Jaccard distance, one value per adjacent pair, N−1 values)
///   - change_rate_mean / change_rate_std (population std-dev)
///   - all_in_index:  p / N for the first 1-based position p where every
///     member of U has appeared; ids outside U are not counted
///   - final_scene_size_index:  |last segment| / |U|
///   - central_character_entry_index:  p / N for the first segment holding
///     the central character
///   - characters_last_in:  ids of the last segment, comma-joined
///
/// Characters declared but never on stage still count towards |U|, so a
/// play with silent roles has no all-in index.

#include "dramanet/ranking.hpp"
#include "dramanet/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace dramanet::temporal {

/// Turnover and timing statistics of one play.
struct TemporalDynamics {
    std::vector<double> change_rates;
    Measure change_rate_mean = Measure::undefined(UndefinedReason::TooFewSegments);
    Measure change_rate_std  = Measure::undefined(UndefinedReason::TooFewSegments);
    Measure all_in_index     = Measure::undefined(UndefinedReason::EmptySequence);
    Measure final_scene_size_index        = Measure::undefined(UndefinedReason::EmptySequence);
    Measure central_character_entry_index = Measure::undefined(UndefinedReason::EmptySequence);
    std::string characters_last_in;
};

/// Stateless calculator for TemporalDynamics.
class TemporalAnalyzer {
public:
    [[nodiscard]] static TemporalDynamics
    analyze(const PlayRecord& play, const ranking::CentralCharacter& central);

    /// Jaccard distance of two segments; 0 when both are empty.
    [[nodiscard]] static double change_rate(const Segment& s, const Segment& t);

    /// One change rate per adjacent pair.
    [[nodiscard]] static std::vector<double> change_rates(const SegmentSequence& segments);

    [[nodiscard]] static Measure
    all_in_index(const SegmentSequence& segments, const std::set<CharacterId>& universe);

    [[nodiscard]] static Measure
    final_scene_size_index(const SegmentSequence& segments, std::size_t universe_size) noexcept;

    [[nodiscard]] static Measure
    central_character_entry_index(const SegmentSequence& segments,
                                  const ranking::CentralCharacter& central);

    [[nodiscard]] static std::string characters_last_in(const SegmentSequence& segments);
};

} // namespace dramanet::temporal
