/// @file tests/core/test_diagnostics.cpp
/// @brief Tests for DiagnosticLog.

#include <gtest/gtest.h>
#include "dramanet/diagnostics.hpp"

using namespace dramanet::core;

TEST(DiagnosticLog, RecordsWithSeverityAndPlay) {
    DiagnosticLog log;
    log.info("lina001", "{} segments", 12);
    log.warn("lina001", "line {}: skipping unknown key '{}'", 3, "foo");
    log.error("lina002", "{} undefined ({})", "avgpathlength", "graph has no nodes");

    ASSERT_EQ(log.entries().size(), 3u);
    EXPECT_EQ(log.entries()[0].severity, Severity::Info);
    EXPECT_EQ(log.entries()[0].message, "12 segments");
    EXPECT_EQ(log.entries()[1].message, "line 3: skipping unknown key 'foo'");
    EXPECT_EQ(log.entries()[2].play_id, "lina002");

    EXPECT_EQ(log.count(Severity::Info), 1u);
    EXPECT_EQ(log.count(Severity::Warning), 1u);
    EXPECT_EQ(log.count(Severity::Error), 1u);
}

TEST(DiagnosticLog, LineFormat) {
    const Diagnostic d{Severity::Error, "lina042", "avgpathlength undefined (graph has no nodes)"};
    EXPECT_EQ(d.to_string(),
              "[dramanet] ERROR lina042: avgpathlength undefined (graph has no nodes)");
}

TEST(DiagnosticLog, TakeEmptiesLog) {
    DiagnosticLog log;
    log.warn("x", "one");
    log.warn("x", "two");
    const auto taken = log.take();
    EXPECT_EQ(taken.size(), 2u);
    EXPECT_TRUE(log.entries().empty());
    EXPECT_EQ(log.count(Severity::Warning), 0u);
}

TEST(DiagnosticLog, EchoStillRecords) {
    DiagnosticLog log(true);
    log.info("echo", "printed to stderr");
    EXPECT_EQ(log.entries().size(), 1u);
}

TEST(Severity, Names) {
    EXPECT_STREQ(to_string(Severity::Info), "INFO");
    EXPECT_STREQ(to_string(Severity::Warning), "WARNING");
    EXPECT_STREQ(to_string(Severity::Error), "ERROR");
}
