/// @file src/core/corpus_analyzer.cpp
/// @brief CorpusAnalyzer implementation.

#include "dramanet/corpus.hpp"

#include <exception>

namespace dramanet::core {

CorpusAnalyzer::CorpusAnalyzer(AnalysisConfig config)
    : config_(config)
    , analyzer_(std::move(config))
{}

CorpusResult CorpusAnalyzer::analyze(std::span<const PlayRecord> plays) {
    DiagnosticLog log(config_.verbose);
    CorpusResult out;
    out.analyses.reserve(plays.size());

    for (const auto& play : plays) {
        try {
            out.analyses.push_back(analyzer_.analyze(play));
        } catch (const std::exception& e) {
            log.error(play.id, "analysis aborted: {}", e.what());
            out.failed.push_back(play.id);
        }
    }

    log.info("corpus", "analyzed {} of {} plays", out.analyses.size(), plays.size());
    out.diagnostics = log.take();
    return out;
}

} // namespace dramanet::core
