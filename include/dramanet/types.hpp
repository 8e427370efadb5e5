#pragma once

/// @file include/dramanet/types.hpp
/// @brief Shared value types for the dramanet play-network analysis system.
///
/// Every module includes this file. It defines the play input record
/// (universe + ordered segment sequence) and the tagged numeric result used
/// for every statistic that can be undefined.

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dramanet {

// ─── Play Input ───────────────────────────────────────────────────────────────

/// Canonical character identifier, already resolved from source aliases.
using CharacterId = std::string;

/// Characters present in one structural unit (scene or act).
/// Duplicate-free; iterates in lexicographic id order.
using Segment = std::set<CharacterId>;

/// Segments in textual order.
using SegmentSequence = std::vector<Segment>;

/// Bibliographic data carried alongside a play. Nothing in the analysis
/// core reads it except the report layer.
struct PlayMetadata {
    std::string        title;
    std::string        subtitle;
    std::string        genre_title;
    std::string        author;
    std::optional<int> date_print;
    std::optional<int> date_written;
    std::optional<int> date_premiere;
    std::string        count_type = "acts";  ///< "scenes" or "acts"

    /// Year used to date the play.
    ///
    /// The earlier of print and premiere year (whichever exist). A written
    /// year more than DEFINITE_YEAR_WRITTEN_GAP years earlier replaces it; a
    /// written year alone is used as is.
    ///
    /// # Returns
    /// `nullopt` if no date is known.
    [[nodiscard]] std::optional<int> definite_year() const noexcept;
};

/// One play as handed over by a reader: identifier, declared cast and the
/// ordered sequence of character-presence sets.
struct PlayRecord {
    std::string      id;
    PlayMetadata     metadata;
    std::set<CharacterId> universe;  ///< Declared cast, including silent roles
    SegmentSequence  segments;
};

// ─── Measure ──────────────────────────────────────────────────────────────────

/// Why a statistic has no value.
enum class UndefinedReason {
    EmptyGraph,            ///< Graph has no nodes
    EmptySequence,         ///< Play has no segments
    TooFewSegments,        ///< Fewer than two segments, no adjacent pair
    EmptyUniverse,         ///< Declared cast is empty
    UniverseNeverComplete, ///< Cumulative cast never reaches the universe size
    CentralCharacterTied,  ///< Several characters share the top position
    NoCentralCharacter,    ///< No character to rank
    CharacterNeverAppears, ///< Central character is in no segment
    NoSuccessfulSamples,   ///< Every null-model sample failed
};

/// Convert an UndefinedReason to a human-readable string.
[[nodiscard]] const char* to_string(UndefinedReason reason) noexcept;

/// A numeric statistic that is either defined or carries the reason it is not.
class Measure {
public:
    [[nodiscard]] static Measure defined(double value) noexcept {
        Measure m;
        m.value_ = value;
        return m;
    }

    [[nodiscard]] static Measure undefined(UndefinedReason reason) noexcept {
        Measure m;
        m.reason_ = reason;
        return m;
    }

    [[nodiscard]] bool is_defined() const noexcept { return value_.has_value(); }

    /// Throws std::bad_optional_access when undefined.
    [[nodiscard]] double value() const { return value_.value(); }

    [[nodiscard]] double value_or(double fallback) const noexcept {
        return value_.value_or(fallback);
    }

    /// `nullopt` when the measure is defined.
    [[nodiscard]] std::optional<UndefinedReason> reason() const noexcept {
        if (value_) return std::nullopt;
        return reason_;
    }

    [[nodiscard]] const std::optional<double>& as_optional() const noexcept {
        return value_;
    }

private:
    Measure() = default;

    std::optional<double> value_;
    UndefinedReason       reason_ = UndefinedReason::EmptyGraph;
};

} // namespace dramanet
