/// @file tests/core/test_types.cpp
/// @brief Tests for Measure and PlayMetadata::definite_year.

#include <gtest/gtest.h>
#include "dramanet/types.hpp"

#include <optional>
#include <string>

using namespace dramanet;

// ─── Measure ─────────────────────────────────────────────────────────────────

TEST(Measure, Defined) {
    const auto m = Measure::defined(0.25);
    EXPECT_TRUE(m.is_defined());
    EXPECT_DOUBLE_EQ(m.value(), 0.25);
    EXPECT_FALSE(m.reason().has_value());
    EXPECT_EQ(m.as_optional(), std::optional<double>(0.25));
}

TEST(Measure, Undefined) {
    const auto m = Measure::undefined(UndefinedReason::TooFewSegments);
    EXPECT_FALSE(m.is_defined());
    EXPECT_EQ(m.reason(), UndefinedReason::TooFewSegments);
    EXPECT_DOUBLE_EQ(m.value_or(-1.0), -1.0);
    EXPECT_THROW((void)m.value(), std::bad_optional_access);
}

TEST(Measure, ReasonStrings) {
    EXPECT_EQ(std::string(to_string(UndefinedReason::EmptyGraph)), "graph has no nodes");
    EXPECT_EQ(std::string(to_string(UndefinedReason::UniverseNeverComplete)),
              "not every declared character appears");
}

// ─── definite_year ───────────────────────────────────────────────────────────

TEST(DefiniteYear, EarlierOfPrintAndPremiere) {
    PlayMetadata m;
    m.date_print    = 1772;
    m.date_premiere = 1771;
    EXPECT_EQ(m.definite_year(), 1771);
}

TEST(DefiniteYear, SingleDate) {
    PlayMetadata m;
    m.date_print = 1800;
    EXPECT_EQ(m.definite_year(), 1800);

    PlayMetadata w;
    w.date_written = 1790;
    EXPECT_EQ(w.definite_year(), 1790);
}

TEST(DefiniteYear, WrittenLongBefore_ReplacesIt) {
    PlayMetadata m;
    m.date_print   = 1830;
    m.date_written = 1815;
    EXPECT_EQ(m.definite_year(), 1815);
}

TEST(DefiniteYear, WrittenShortlyBefore_Ignored) {
    PlayMetadata m;
    m.date_premiere = 1830;
    m.date_written  = 1820;  // exactly the gap
    EXPECT_EQ(m.definite_year(), 1830);
}

TEST(DefiniteYear, NoDates_Nullopt) {
    EXPECT_FALSE(PlayMetadata{}.definite_year().has_value());
}
