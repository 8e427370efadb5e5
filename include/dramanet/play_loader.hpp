#pragma once

/// @file include/dramanet/play_loader.hpp
/// @brief Line-oriented play file loader.
///
/// # Module: PlayLoader
///
/// ## Responsibility
/// Read a play's metadata, declared cast (with aliases) and ordered segment
/// sequence from a plain-text `.play` file into a PlayRecord. Malformed lines
/// are skipped with a warning; the loader never crashes on bad input.
///
/// ## Expected Format
/// ```
/// # Lessing, Emilia Galotti
/// id: lina042
/// title: Emilia Galotti
/// author: Lessing, Gotthold Ephraim
/// date_print: 1772
/// date_premiere: 1772
/// count_type: scenes
/// character: Emilia
/// character: Der_Prinz = prinz prince
/// segment: prinz, Emilia
/// segment: Emilia
/// ```
/// `key: value` per line; `#` starts a comment line. A `character` line
/// declares a canonical id followed, after `=`, by whitespace-separated
/// aliases. A `segment` line lists speakers (ids or aliases), comma-separated;
/// repeats collapse. Speakers never declared are added to the cast with a
/// warning.
///
/// ## Guarantees
/// - Returns `nullopt` only when the file cannot be opened
/// - Skips individual bad lines rather than failing the entire load
/// - Does not modify any file or external state

#include "dramanet/diagnostics.hpp"
#include "dramanet/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dramanet::core {

/// Loads PlayRecords from `.play` files and strings.
class PlayLoader {
public:
    /// Load a play from disk. The file stem is the id unless an `id:` line
    /// overrides it.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened.
    [[nodiscard]] static std::optional<PlayRecord>
    load_file(const std::string& filepath, DiagnosticLog& log);

    [[nodiscard]] static std::optional<PlayRecord>
    load_file(const std::string& filepath);

    /// Parse a play from text (useful for testing). Never fails; an empty
    /// text gives a play with no cast and no segments.
    [[nodiscard]] static PlayRecord
    parse_string(std::string_view text, std::string fallback_id, DiagnosticLog& log);

    [[nodiscard]] static PlayRecord
    parse_string(std::string_view text, std::string fallback_id);

    /// Parse a year such as "1772". `nullopt` on anything else.
    [[nodiscard]] static std::optional<int> parse_year(std::string_view text) noexcept;
};

} // namespace dramanet::core
