/// @file tests/core/test_report.cpp
/// @brief Tests for the `;`-separated report renderings.

#include <gtest/gtest.h>
#include "dramanet/analyzer.hpp"
#include "dramanet/report.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace dramanet;
using namespace dramanet::core;

namespace {

PlayAnalysis analyze_triangle() {
    PlayRecord play;
    play.id = "tri";
    play.metadata.title  = "Dreieck";
    play.metadata.author = "Anonymous";
    play.metadata.date_print = 1790;
    play.universe = {"A", "B", "C", "D"};
    play.segments = {{"A", "B"}, {"B", "C"}, {"A", "C"}};

    AnalysisConfig cfg;
    cfg.randomization  = 5;
    cfg.sampler.seed   = 1;
    return PlayAnalyzer(cfg).analyze(play);
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST(Report, FormatMeasure) {
    EXPECT_EQ(report::format_measure(Measure::defined(0.5)), "0.5");
    EXPECT_EQ(report::format_measure(Measure::undefined(UndefinedReason::EmptyGraph)), "NaN");
}

TEST(Report, SummaryLines) {
    const auto text = report::summary(analyze_triangle());
    EXPECT_TRUE(contains(text, "ID;tri\n"));
    EXPECT_TRUE(contains(text, "year;1790\n"));
    EXPECT_TRUE(contains(text, "charcount;3\n"));
    EXPECT_TRUE(contains(text, "edgecount;3\n"));
    EXPECT_TRUE(contains(text, "connected_components;1\n"));
    EXPECT_TRUE(contains(text, "all_in_index;NaN\n"));
    EXPECT_TRUE(contains(text, "central_character;SEVERAL\n"));
    EXPECT_TRUE(contains(text, "central_character_entry_index;NaN\n"));
    EXPECT_TRUE(contains(text, "characters_last_in;A,C\n"));
}

TEST(Report, EdgeList) {
    const auto text = report::edge_list(analyze_triangle().graph);
    EXPECT_EQ(text, "source;target;weight\nA;B;1\nA;C;1\nB;C;1\n");
}

TEST(Report, ChangeRatesNumberedFromOne) {
    const std::vector<double> rates{0.5, 0.25};
    EXPECT_EQ(report::change_rates(rates), "segment;change_rate\n1;0.5\n2;0.25\n");
}

TEST(Report, CharacterTableOneRowPerCharacter) {
    const auto text = report::character_table(analyze_triangle().characters);
    EXPECT_TRUE(text.starts_with("name;frequency;degree;"));
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 4);
    EXPECT_TRUE(contains(text, "\nA;2;2;"));
}

TEST(Report, CorpusTables) {
    const std::vector<PlayAnalysis> analyses{analyze_triangle()};

    const auto metrics = report::corpus_metrics(analyses);
    EXPECT_TRUE(metrics.starts_with("ID;author;title;subtitle;year;genretitle;charcount;"));
    EXPECT_TRUE(contains(metrics, "\ntri;Anonymous;Dreieck;;1790;;3;3;"));

    const auto central = report::central_characters(analyses);
    EXPECT_EQ(central,
              "ID;author;title;year;frequency;degree;betweenness;closeness;central\n"
              "tri;Anonymous;Dreieck;1790;SEVERAL;SEVERAL;SEVERAL;SEVERAL;SEVERAL\n");
}

TEST(Report, UnknownYearRendersNaN) {
    auto a = analyze_triangle();
    a.summary.metadata.date_print.reset();
    EXPECT_TRUE(contains(report::summary(a), "year;NaN\n"));
}
