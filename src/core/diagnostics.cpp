/// @file src/core/diagnostics.cpp
/// @brief DiagnosticLog implementation.

#include "dramanet/diagnostics.hpp"

#include <algorithm>
#include <cstdio>

namespace dramanet::core {

const char* to_string(Severity s) noexcept {
    switch (s) {
        case Severity::Info:    return "INFO";
        case Severity::Warning: return "WARNING";
        case Severity::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

std::string Diagnostic::to_string() const {
    return fmt::format("[dramanet] {} {}: {}", core::to_string(severity), play_id, message);
}

void DiagnosticLog::record(Severity severity, std::string_view play_id,
                           std::string message) {
    entries_.push_back(Diagnostic{
        .severity = severity,
        .play_id  = std::string(play_id),
        .message  = std::move(message),
    });
    if (echo_) {
        fmt::print(stderr, "{}\n", entries_.back().to_string());
    }
}

std::size_t DiagnosticLog::count(Severity severity) const noexcept {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [severity](const Diagnostic& d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticLog::take() noexcept {
    return std::exchange(entries_, {});
}

} // namespace dramanet::core
