#pragma once

/// @file include/dramanet/diagnostics.hpp
/// @brief Per-play diagnostic log.
///
/// Every statistic that comes out undefined, every input line the loader
/// skips and every play a corpus run gives up on is recorded here with the
/// play id. Records stay attached to the analysis result; with `echo` set
/// they are also printed to stderr as they arrive:
///
///     [dramanet] ERROR lina042: avgpathlength undefined (graph has no nodes)

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dramanet::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

[[nodiscard]] const char* to_string(Severity s) noexcept;

/// One logged event.
struct Diagnostic {
    Severity    severity;
    std::string play_id;
    std::string message;

    /// "[dramanet] <SEVERITY> <play_id>: <message>"
    [[nodiscard]] std::string to_string() const;
};

/// Append-only collection of diagnostics.
class DiagnosticLog {
public:
    /// With `echo` set, also print each record to stderr when it is logged.
    explicit DiagnosticLog(bool echo = false) noexcept : echo_(echo) {}

    void record(Severity severity, std::string_view play_id, std::string message);

    template <typename... Args>
    void info(std::string_view play_id, fmt::format_string<Args...> f, Args&&... args) {
        record(Severity::Info, play_id, fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(std::string_view play_id, fmt::format_string<Args...> f, Args&&... args) {
        record(Severity::Warning, play_id, fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::string_view play_id, fmt::format_string<Args...> f, Args&&... args) {
        record(Severity::Error, play_id, fmt::format(f, std::forward<Args>(args)...));
    }

    [[nodiscard]] const std::vector<Diagnostic>& entries() const noexcept { return entries_; }

    [[nodiscard]] std::size_t count(Severity severity) const noexcept;

    /// Move all records out, leaving the log empty.
    [[nodiscard]] std::vector<Diagnostic> take() noexcept;

private:
    bool                    echo_;
    std::vector<Diagnostic> entries_;
};

} // namespace dramanet::core
