#include <gtest/gtest.h>

#include "build/build_log.hpp"

#include <regex>
#include <string>

namespace forge {
namespace {

TEST(BuildLogTest, KeepsLastLinesWithinCap) {
    BuildLog log(3);
    for (int i = 0; i < 10; ++i) {
        log.Append("line " + std::to_string(i));
        EXPECT_LE(log.Size(), 3u);
    }
    const auto snap = log.Snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[0], "line 7");
    EXPECT_EQ(snap[1], "line 8");
    EXPECT_EQ(snap[2], "line 9");
}

TEST(BuildLogTest, SnapshotIsIndependentCopy) {
    BuildLog log(5);
    log.Append("a");
    auto snap = log.Snapshot();
    log.Append("b");
    EXPECT_EQ(snap.size(), 1u);
    EXPECT_EQ(log.Size(), 2u);
}

TEST(BuildLogTest, FindLastScansNewestFirst) {
    BuildLog log(10);
    log.Append("RAM:   [=         ]   9.0% (used 1 bytes from 2 bytes)");
    log.Append("noise");
    log.Append("RAM:   [==        ]  10.3% (used 33756 bytes from 327680 bytes)");
    const std::string* hit = log.FindLast("RAM:");
    ASSERT_NE(hit, nullptr);
    EXPECT_NE(hit->find("10.3%"), std::string::npos);
    EXPECT_EQ(log.FindLast("Flash:"), nullptr);
}

TEST(BuildLogTest, KeywordFilter) {
    EXPECT_TRUE(IsCompilationRelevant("Compiling .pio/build/esp32c3/src/main.o"));
    EXPECT_TRUE(IsCompilationRelevant("Flash: [===       ]  28.1% (used 294563 bytes)"));
    EXPECT_TRUE(IsCompilationRelevant("src/main.c:3:1: error: expected ';'"));
    EXPECT_TRUE(IsCompilationRelevant("[SUCCESS] Took 12.3 seconds"));
    EXPECT_TRUE(IsCompilationRelevant("Progress 45%"));
    EXPECT_FALSE(IsCompilationRelevant("Processing esp32c3 (platform: espressif32)"));
    EXPECT_FALSE(IsCompilationRelevant("--------------------------------"));

    EXPECT_TRUE(AcceptAllLines()("anything at all"));
    EXPECT_FALSE(KeywordLineFilter()("plain chatter"));
}

TEST(BuildLogTest, LineFormat) {
    const std::string line = FormatBuildLogLine("WARN", "disk almost full");
    EXPECT_TRUE(std::regex_match(line, std::regex(R"(\[\d{2}:\d{2}:\d{2}\] \[WARN\] disk almost full)")));
}

TEST(BuildLogTest, UsageSummary) {
    EXPECT_EQ(ExtractUsageSummary("RAM:   [=         ]  10.3% (used 33756 bytes from 327680 bytes)", "RAM:"),
              "10.3% (used 33756 bytes from 327680 bytes)");
    EXPECT_EQ(ExtractUsageSummary("Flash: 28.1% (used 294563 bytes)", "Flash:"),
              "28.1% (used 294563 bytes)");
    EXPECT_EQ(ExtractUsageSummary("nothing here", "RAM:"), "");
}

TEST(BuildLogTest, IllFormedUtf8IsReplaced) {
    EXPECT_EQ(ToValidUtf8("caf\xC3\xA9 \xE2\x9C\x93"), "caf\xC3\xA9 \xE2\x9C\x93");
    EXPECT_EQ(ToValidUtf8("caf\xE9.c"), "caf\xEF\xBF\xBD.c");
    // Overlong slash, lone surrogate, truncated tail.
    EXPECT_EQ(ToValidUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(ToValidUtf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(ToValidUtf8("ok\xF0\x9F"), "ok\xEF\xBF\xBD\xEF\xBF\xBD");

    BuildLog log(2);
    log.Append("Compiling caf\xE9.c");
    EXPECT_EQ(log.Snapshot().front(), "Compiling caf\xEF\xBF\xBD.c");
}

} // namespace
} // namespace forge
