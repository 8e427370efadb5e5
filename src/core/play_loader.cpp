/// @file src/core/play_loader.cpp
/// @brief PlayLoader for line-oriented `.play` files.

#include "dramanet/play_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace dramanet::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Split on any of `delims`, dropping empty pieces.
[[nodiscard]] std::vector<std::string_view>
split(std::string_view s, std::string_view delims) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        const auto end = s.find_first_of(delims, start);
        const auto piece = trim(s.substr(start, end == std::string_view::npos
                                                    ? std::string_view::npos
                                                    : end - start));
        if (!piece.empty()) parts.push_back(piece);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return parts;
}

/// Parser state for one play.
class PlayParser {
public:
    PlayParser(std::string fallback_id, DiagnosticLog& log)
        : log_(log)
    {
        play_.id = std::move(fallback_id);
    }

    void parse_line(std::string_view raw, std::size_t line_no) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#') return;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            log_.warn(play_.id, "line {}: skipping malformed line '{}'", line_no, line);
            return;
        }
        const std::string key   = lower(trim(line.substr(0, colon)));
        const std::string_view value = trim(line.substr(colon + 1));

        if      (key == "id")            set_id(value, line_no);
        else if (key == "title")         play_.metadata.title       = value;
        else if (key == "subtitle")      play_.metadata.subtitle    = value;
        else if (key == "genre")         play_.metadata.genre_title = value;
        else if (key == "author")        play_.metadata.author      = value;
        else if (key == "date_print")    set_year(play_.metadata.date_print, key, value, line_no);
        else if (key == "date_written")  set_year(play_.metadata.date_written, key, value, line_no);
        else if (key == "date_premiere") set_year(play_.metadata.date_premiere, key, value, line_no);
        else if (key == "count_type")    set_count_type(value, line_no);
        else if (key == "character")     declare_character(value, line_no);
        else if (key == "segment")       add_segment(value);
        else {
            log_.warn(play_.id, "line {}: skipping unknown key '{}'", line_no, key);
        }
    }

    [[nodiscard]] PlayRecord finish() { return std::move(play_); }

private:
    void set_id(std::string_view value, std::size_t line_no) {
        if (value.empty()) {
            log_.warn(play_.id, "line {}: empty id ignored", line_no);
            return;
        }
        play_.id = value;
    }

    void set_year(std::optional<int>& field, std::string_view key,
                  std::string_view value, std::size_t line_no) {
        if (auto year = PlayLoader::parse_year(value)) {
            field = *year;
        } else {
            log_.warn(play_.id, "line {}: {} '{}' is not a year", line_no, key, value);
        }
    }

    void set_count_type(std::string_view value, std::size_t line_no) {
        const auto type = lower(value);
        if (type != "scenes" && type != "acts") {
            log_.warn(play_.id, "line {}: count_type '{}' is neither scenes nor acts",
                      line_no, value);
            return;
        }
        play_.metadata.count_type = type;
    }

    void declare_character(std::string_view value, std::size_t line_no) {
        const auto eq = value.find('=');
        const auto id = trim(value.substr(0, eq));
        if (id.empty()) {
            log_.warn(play_.id, "line {}: character without an id", line_no);
            return;
        }

        const CharacterId canonical(id);
        play_.universe.insert(canonical);
        add_alias(canonical, canonical, line_no);

        if (eq != std::string_view::npos) {
            for (auto alias : split(value.substr(eq + 1), " \t,")) {
                add_alias(std::string(alias), canonical, line_no);
            }
        }
    }

    void add_alias(const std::string& alias, const CharacterId& canonical,
                   std::size_t line_no) {
        const auto [it, inserted] = aliases_.emplace(alias, canonical);
        if (!inserted && it->second != canonical) {
            log_.warn(play_.id, "line {}: alias '{}' already names '{}'",
                      line_no, alias, it->second);
        }
    }

    void add_segment(std::string_view value) {
        Segment segment;
        for (auto speaker : split(value, ",")) {
            segment.insert(resolve(speaker));
        }
        play_.segments.push_back(std::move(segment));
    }

    [[nodiscard]] CharacterId resolve(std::string_view speaker) {
        const std::string key(speaker);
        if (const auto it = aliases_.find(key); it != aliases_.end()) {
            return it->second;
        }
        log_.warn(play_.id, "speaker '{}' is not declared; adding to the cast", speaker);
        play_.universe.insert(key);
        aliases_.emplace(key, key);
        return key;
    }

    DiagnosticLog&                     log_;
    PlayRecord                         play_;
    std::map<std::string, CharacterId> aliases_;
};

} // anonymous namespace

// ─── PlayLoader::parse_year ───────────────────────────────────────────────────

std::optional<int> PlayLoader::parse_year(std::string_view text) noexcept {
    const auto t = trim(text);
    if (t.empty()) return std::nullopt;

    int year = 0;
    const auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), year);
    if (ec != std::errc{} || ptr != t.data() + t.size()) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    return year;
}

// ─── PlayLoader::parse_string ─────────────────────────────────────────────────

PlayRecord PlayLoader::parse_string(std::string_view text, std::string fallback_id,
                                    DiagnosticLog& log) {
    PlayParser parser(std::move(fallback_id), log);

    std::size_t line_no = 0;
    std::size_t start   = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        ++line_no;
        parser.parse_line(text.substr(start, end == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : end - start),
                          line_no);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return parser.finish();
}

PlayRecord PlayLoader::parse_string(std::string_view text, std::string fallback_id) {
    DiagnosticLog discard;
    return parse_string(text, std::move(fallback_id), discard);
}

// ─── PlayLoader::load_file ────────────────────────────────────────────────────

std::optional<PlayRecord>
PlayLoader::load_file(const std::string& filepath, DiagnosticLog& log) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        log.error(filepath, "cannot open file");
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    return parse_string(contents.str(),
                        std::filesystem::path(filepath).stem().string(), log);
}

std::optional<PlayRecord> PlayLoader::load_file(const std::string& filepath) {
    DiagnosticLog discard;
    return load_file(filepath, discard);
}

} // namespace dramanet::core
