/// @file src/main.cpp
/// @brief dramanet CLI entry point.
///
/// Usage:
///   dramanet --play <file> [options]        Analyze one play
///   dramanet --corpus <file>... [options]   Analyze several plays
///   dramanet --help                         Print usage

#include "dramanet/analyzer.hpp"
#include "dramanet/corpus.hpp"
#include "dramanet/play_loader.hpp"
#include "dramanet/report.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  dramanet --play <file> [--chars] [--edges] [--change-rates] [options]\n"
        "  dramanet --corpus <file>... [--central] [options]\n"
        "  dramanet --help\n"
        "\n"
        "Options:\n"
        "  --seed <n>      Fix the random baseline seed\n"
        "  --samples <n>   Random graphs per play (default {})\n"
        "  --own-column    Match top-ranked characters against each metric's own column\n"
        "  --verbose       Print diagnostics to stderr\n"
        "\n"
        "Play file format: one 'key: value' per line, see play_loader.hpp\n",
        dramanet::constants::DEFAULT_RANDOMIZATION);
}

/// Parsed command line.
struct Options {
    std::string              mode;
    std::vector<std::string> files;
    bool chars        = false;
    bool edges        = false;
    bool change_rates = false;
    bool central      = false;
    dramanet::core::AnalysisConfig config{};
};

[[nodiscard]] std::optional<std::uint64_t> parse_count(std::string_view s) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

/// Returns nullopt (after printing the reason) on a bad command line.
[[nodiscard]] std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    opts.mode = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--chars") {
            opts.chars = true;
        } else if (arg == "--edges") {
            opts.edges = true;
        } else if (arg == "--change-rates") {
            opts.change_rates = true;
        } else if (arg == "--central") {
            opts.central = true;
        } else if (arg == "--own-column") {
            opts.config.top_rank_policy = dramanet::ranking::TopRankPolicy::OwnColumn;
        } else if (arg == "--verbose") {
            opts.config.verbose = true;
        } else if (arg == "--seed" || arg == "--samples") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            const auto value = parse_count(argv[++i]);
            if (!value) {
                fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n",
                           arg, argv[i]);
                return std::nullopt;
            }
            if (arg == "--seed") {
                opts.config.sampler.seed = *value;
            } else {
                opts.config.randomization = static_cast<std::size_t>(*value);
                opts.config.fallback_randomization =
                    std::min(opts.config.fallback_randomization, opts.config.randomization);
            }
        } else if (arg.starts_with("--")) {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            opts.files.emplace_back(arg);
        }
    }
    return opts;
}

/// Analyze a single play file. Returns 0 on success, 1 on error.
int run_play(const Options& opts) {
    if (opts.files.size() != 1) {
        fmt::print(stderr, "Error: --play requires exactly one file\n");
        return 1;
    }

    dramanet::core::DiagnosticLog log(opts.config.verbose);
    auto play = dramanet::core::PlayLoader::load_file(opts.files.front(), log);
    if (!play) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.files.front());
        return 1;
    }

    dramanet::core::PlayAnalyzer analyzer(opts.config);
    const auto result = analyzer.analyze(*play);

    fmt::print("{}", dramanet::core::report::summary(result));
    if (opts.chars) {
        fmt::print("\n{}", dramanet::core::report::character_table(result.characters));
    }
    if (opts.edges) {
        fmt::print("\n{}", dramanet::core::report::edge_list(result.graph));
    }
    if (opts.change_rates) {
        fmt::print("\n{}", dramanet::core::report::change_rates(
                               result.summary.temporal.change_rates));
    }
    return 0;
}

/// Analyze every play file given. Unreadable files are reported and
/// skipped. Returns 0 if at least one play was analyzed.
int run_corpus(const Options& opts) {
    if (opts.files.empty()) {
        fmt::print(stderr, "Error: --corpus requires at least one file\n");
        return 1;
    }

    dramanet::core::DiagnosticLog log(opts.config.verbose);
    std::vector<dramanet::PlayRecord> plays;
    for (const auto& path : opts.files) {
        if (auto play = dramanet::core::PlayLoader::load_file(path, log)) {
            plays.push_back(std::move(*play));
        } else {
            fmt::print(stderr, "Skipping unreadable file: {}\n", path);
        }
    }

    dramanet::core::CorpusAnalyzer corpus(opts.config);
    const auto result = corpus.analyze(plays);

    for (const auto& id : result.failed) {
        fmt::print(stderr, "Analysis failed for play '{}'\n", id);
    }
    if (result.analyses.empty()) {
        fmt::print(stderr, "Error: no play could be analyzed\n");
        return 1;
    }

    if (opts.central) {
        fmt::print("{}", dramanet::core::report::central_characters(result.analyses));
    } else {
        fmt::print("{}", dramanet::core::report::corpus_metrics(result.analyses));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    if (mode == "--play") {
        return run_play(*opts);
    }

    if (mode == "--corpus") {
        return run_corpus(*opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
