/**
 * @file  fuzz_play_loader.cpp
 * @brief libFuzzer target for PlayLoader and the full PlayAnalyzer pipeline
 *
 * Build:
 *   cmake -DDRAMANET_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_play_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_play_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every segment member is in the universe.
 *   3. Every graph node appears in some segment; charcount ≤ |universe|.
 *   4. Defined metrics are finite; density and clustering lie in [0, 1].
 *   5. Every rendered report ends with a newline.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view to parse_string(), so the
 *   parser sees binary garbage, missing colons, stray '=' and ',' runs,
 *   CR/LF mixes and huge year literals.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "dramanet/analyzer.hpp"
#include "dramanet/play_loader.hpp"
#include "dramanet/report.hpp"

using namespace dramanet;
using namespace dramanet::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto play = PlayLoader::parse_string(input, "fuzz");

    // Invariant 2: loader keeps segments inside the universe
    for (const auto& segment : play.segments) {
        for (const auto& id : segment) {
            assert(play.universe.count(id) == 1);
        }
    }

    AnalysisConfig cfg;
    cfg.randomization          = 3;
    cfg.fallback_randomization = 2;
    cfg.sampler.seed           = 0;
    cfg.sampler.path_length_attempts = 3;
    PlayAnalyzer analyzer(cfg);
    const auto result = analyzer.analyze(play);
    const auto& g = result.summary.graph;

    // Invariant 3: nodes are on-stage characters
    assert(g.charcount <= play.universe.size());
    assert(result.characters.size() == g.charcount);

    // Invariant 4: bounded metrics
    if (g.density.is_defined()) {
        assert(std::isfinite(g.density.value()));
        assert(g.density.value() >= 0.0 && g.density.value() <= 1.0);
    }
    if (g.clustering_coefficient.is_defined()) {
        assert(g.clustering_coefficient.value() >= 0.0);
        assert(g.clustering_coefficient.value() <= 1.0);
    }
    if (g.avgpathlength.is_defined()) {
        assert(std::isfinite(g.avgpathlength.value()));
    }

    // Invariant 5: reports render
    const auto text = report::summary(result);
    assert(!text.empty() && text.back() == '\n');

    return 0;
}
