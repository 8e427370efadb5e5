/// @file src/core/types.cpp
/// @brief Out-of-line helpers for the shared value types.

#include "dramanet/types.hpp"
#include "dramanet/constants.hpp"

#include <algorithm>

namespace dramanet {

const char* to_string(UndefinedReason reason) noexcept {
    switch (reason) {
        case UndefinedReason::EmptyGraph:            return "graph has no nodes";
        case UndefinedReason::EmptySequence:         return "play has no segments";
        case UndefinedReason::TooFewSegments:        return "fewer than two segments";
        case UndefinedReason::EmptyUniverse:         return "no declared characters";
        case UndefinedReason::UniverseNeverComplete: return "not every declared character appears";
        case UndefinedReason::CentralCharacterTied:  return "several central characters";
        case UndefinedReason::NoCentralCharacter:    return "no central character";
        case UndefinedReason::CharacterNeverAppears: return "character appears in no segment";
        case UndefinedReason::NoSuccessfulSamples:   return "no random sample succeeded";
    }
    return "unknown";
}

std::optional<int> PlayMetadata::definite_year() const noexcept {
    std::optional<int> year;
    if (date_print && date_premiere) {
        year = std::min(*date_print, *date_premiere);
    } else if (date_premiere) {
        year = date_premiere;
    } else {
        year = date_print;
    }

    if (date_written) {
        if (!year || *year - *date_written > constants::DEFINITE_YEAR_WRITTEN_GAP) {
            year = date_written;
        }
    }
    return year;
}

} // namespace dramanet
