#pragma once

/// @file include/dramanet/corpus.hpp
/// @brief Corpus Analyzer: batch analysis with per-play failure isolation.
///
/// Plays are analyzed one after another with a shared PlayAnalyzer. A play
/// whose analysis throws is logged with its id and listed in
/// `CorpusResult::failed`; the batch carries on with the next play.

#include "dramanet/analyzer.hpp"
#include "dramanet/diagnostics.hpp"
#include "dramanet/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace dramanet::core {

/// Outcome of a corpus run.
struct CorpusResult {
    std::vector<PlayAnalysis> analyses;     ///< In input order, failed plays omitted
    std::vector<std::string>  failed;       ///< Ids of plays that could not be analyzed
    std::vector<Diagnostic>   diagnostics;  ///< Corpus-level records
};

class CorpusAnalyzer {
public:
    explicit CorpusAnalyzer(AnalysisConfig config = AnalysisConfig{});

    [[nodiscard]] CorpusResult analyze(std::span<const PlayRecord> plays);

private:
    AnalysisConfig config_;
    PlayAnalyzer   analyzer_;
};

} // namespace dramanet::core
