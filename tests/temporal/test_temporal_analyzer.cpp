/// @file tests/temporal/test_temporal_analyzer.cpp
/// @brief Tests for change rates, all-in index and entry/exit timing.

#include <gtest/gtest.h>
#include "dramanet/temporal.hpp"

#include <cmath>

using namespace dramanet;
using namespace dramanet::ranking;
using namespace dramanet::temporal;

// ─── change_rate ─────────────────────────────────────────────────────────────

TEST(ChangeRate, OneSharedOfThree) {
    // {A,B} → {B,C}: union 3, symmetric difference 2.
    EXPECT_NEAR(TemporalAnalyzer::change_rate({"A", "B"}, {"B", "C"}), 2.0 / 3.0, 1e-12);
}

TEST(ChangeRate, IdenticalIsZero_DisjointIsOne) {
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::change_rate({"A", "B"}, {"A", "B"}), 0.0);
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::change_rate({"A"}, {"B", "C"}), 1.0);
}

TEST(ChangeRate, EmptySegments) {
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::change_rate({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::change_rate({}, {"A"}), 1.0);
}

TEST(ChangeRates, OnePerAdjacentPair) {
    const SegmentSequence segs{{"A"}, {"A", "B"}, {"B"}, {"B"}};
    const auto rates = TemporalAnalyzer::change_rates(segs);
    ASSERT_EQ(rates.size(), 3u);
    EXPECT_DOUBLE_EQ(rates[0], 0.5);
    EXPECT_DOUBLE_EQ(rates[1], 0.5);
    EXPECT_DOUBLE_EQ(rates[2], 0.0);
}

TEST(ChangeRates, FewerThanTwoSegments_Empty) {
    EXPECT_TRUE(TemporalAnalyzer::change_rates({}).empty());
    EXPECT_TRUE(TemporalAnalyzer::change_rates({{"A"}}).empty());
}

// ─── all_in_index ────────────────────────────────────────────────────────────

TEST(AllInIndex, ReachedAtSecondOfFour) {
    const SegmentSequence segs{{"A"}, {"B", "C"}, {"A"}, {"C"}};
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::all_in_index(segs, {"A", "B", "C"}).value(), 0.5);
}

TEST(AllInIndex, SilentRole_Undefined) {
    const SegmentSequence segs{{"A", "B"}, {"B", "C"}, {"A", "C"}};
    const auto m = TemporalAnalyzer::all_in_index(segs, {"A", "B", "C", "D"});
    EXPECT_FALSE(m.is_defined());
    EXPECT_EQ(m.reason(), UndefinedReason::UniverseNeverComplete);
}

TEST(AllInIndex, NoSegments_Undefined) {
    EXPECT_EQ(TemporalAnalyzer::all_in_index({}, {"A", "B"}).reason(),
              UndefinedReason::EmptySequence);
}

TEST(AllInIndex, UndeclaredIdsNotCounted) {
    // X fills the count but B, who is declared, never appears.
    const SegmentSequence segs{{"A", "X"}, {"A"}};
    const auto m = TemporalAnalyzer::all_in_index(segs, {"A", "B"});
    EXPECT_FALSE(m.is_defined());
    EXPECT_EQ(m.reason(), UndefinedReason::UniverseNeverComplete);
}

TEST(AllInIndex, ReachedDespiteExtraIds) {
    const SegmentSequence segs{{"A", "X", "Y"}, {"B"}};
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::all_in_index(segs, {"A", "B"}).value(), 1.0);
}

// ─── final_scene_size_index ──────────────────────────────────────────────────

TEST(FinalSceneSize, FractionOfUniverse) {
    const SegmentSequence segs{{"A", "B", "C"}, {"A"}};
    EXPECT_DOUBLE_EQ(TemporalAnalyzer::final_scene_size_index(segs, 4).value(), 0.25);
}

TEST(FinalSceneSize, Undefined) {
    EXPECT_EQ(TemporalAnalyzer::final_scene_size_index({}, 3).reason(),
              UndefinedReason::EmptySequence);
    EXPECT_EQ(TemporalAnalyzer::final_scene_size_index({{"A"}}, 0).reason(),
              UndefinedReason::EmptyUniverse);
}

// ─── central_character_entry_index ───────────────────────────────────────────

TEST(CentralEntry, FirstAppearance) {
    const SegmentSequence segs{{"A"}, {"A"}, {"B"}, {"B", "A"}};
    const auto m = TemporalAnalyzer::central_character_entry_index(
        segs, CharacterChoice::single("B"));
    EXPECT_DOUBLE_EQ(m.value(), 0.75);
}

TEST(CentralEntry, TiedOrMissing_Undefined) {
    const SegmentSequence segs{{"A"}, {"B"}};
    EXPECT_EQ(TemporalAnalyzer::central_character_entry_index(
                  segs, CharacterChoice::tied({"A", "B"})).reason(),
              UndefinedReason::CentralCharacterTied);
    EXPECT_EQ(TemporalAnalyzer::central_character_entry_index(
                  segs, CharacterChoice::none()).reason(),
              UndefinedReason::NoCentralCharacter);
    EXPECT_EQ(TemporalAnalyzer::central_character_entry_index(
                  segs, CharacterChoice::single("Ghost")).reason(),
              UndefinedReason::CharacterNeverAppears);
}

// ─── characters_last_in ──────────────────────────────────────────────────────

TEST(CharactersLastIn, LexicographicCommaJoined) {
    const SegmentSequence segs{{"Z"}, {"Odoardo", "Emilia", "Der_Prinz"}};
    EXPECT_EQ(TemporalAnalyzer::characters_last_in(segs), "Der_Prinz,Emilia,Odoardo");
    EXPECT_EQ(TemporalAnalyzer::characters_last_in({}), "");
}

// ─── analyze ─────────────────────────────────────────────────────────────────

TEST(TemporalAnalyzer_Analyze, MeanAndPopulationStd) {
    PlayRecord play;
    play.id = "t";
    play.universe = {"A", "B"};
    // Rates: 0.5, 0.5, 0.0 → mean 1/3, population variance 1/18.
    play.segments = {{"A"}, {"A", "B"}, {"B"}, {"B"}};

    const auto t = TemporalAnalyzer::analyze(play, CharacterChoice::single("B"));
    EXPECT_NEAR(t.change_rate_mean.value(), 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(t.change_rate_std.value(), std::sqrt(1.0 / 18.0), 1e-12);
    EXPECT_DOUBLE_EQ(t.all_in_index.value(), 0.5);
    EXPECT_DOUBLE_EQ(t.final_scene_size_index.value(), 0.5);
    EXPECT_DOUBLE_EQ(t.central_character_entry_index.value(), 0.5);
    EXPECT_EQ(t.characters_last_in, "B");
}

TEST(TemporalAnalyzer_Analyze, SingleSegment_ChangeRatesUndefined) {
    PlayRecord play;
    play.universe = {"A"};
    play.segments = {{"A"}};

    const auto t = TemporalAnalyzer::analyze(play, CharacterChoice::single("A"));
    EXPECT_TRUE(t.change_rates.empty());
    EXPECT_EQ(t.change_rate_mean.reason(), UndefinedReason::TooFewSegments);
    EXPECT_EQ(t.change_rate_std.reason(), UndefinedReason::TooFewSegments);
    EXPECT_DOUBLE_EQ(t.all_in_index.value(), 1.0);
}

TEST(TemporalAnalyzer_Analyze, NoSegments_AllUndefined) {
    PlayRecord play;
    play.universe = {"A"};

    const auto t = TemporalAnalyzer::analyze(play, CharacterChoice::none());
    EXPECT_EQ(t.change_rate_mean.reason(), UndefinedReason::EmptySequence);
    EXPECT_FALSE(t.all_in_index.is_defined());
    EXPECT_FALSE(t.final_scene_size_index.is_defined());
    EXPECT_FALSE(t.central_character_entry_index.is_defined());
    EXPECT_TRUE(t.characters_last_in.empty());
}
