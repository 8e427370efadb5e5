#pragma once

#include <cstddef>
#include <string_view>

/// @file include/dramanet/constants.hpp
/// @brief Analysis constants for the dramanet system.

namespace dramanet::constants {

// ─── Null Model ───────────────────────────────────────────────────────────────

/// Number of random graphs drawn per play for the small-world baseline.
static constexpr std::size_t DEFAULT_RANDOMIZATION = 1000;

/// Reduced draw count used once the observed graph needed the
/// largest-component fallback for its average path length.
static constexpr std::size_t FALLBACK_RANDOMIZATION = 50;

/// Fresh draws allowed per sample before its path length is given up.
static constexpr std::size_t PATH_LENGTH_ATTEMPTS = 50;

// ─── Ranking ──────────────────────────────────────────────────────────────────

/// Rendered in place of a character id when several characters tie.
static constexpr std::string_view SEVERAL_SENTINEL = "SEVERAL";

/// Rendered in place of an undefined numeric value.
static constexpr std::string_view UNDEFINED_SENTINEL = "NaN";

/// Relative tolerance under which two metric values count as equal for
/// ranking. Betweenness sums over sources in node order, so characters in
/// identical positions can differ in the last few bits.
static constexpr double RANK_TIE_TOLERANCE = 1e-12;

// ─── Metadata ─────────────────────────────────────────────────────────────────

/// A written date more than this many years before the print/premiere
/// date replaces it as the play's definite year.
static constexpr int DEFINITE_YEAR_WRITTEN_GAP = 10;

} // namespace dramanet::constants
