// ==============================================================================
// test_report_gtest.cpp - Тесты итогового отчёта (GoogleTest)
// ==============================================================================

#include "collector/report.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace collector::report::test {

// ==============================================================================
// human_size
// ==============================================================================

TEST(ReportTest, HumanSize_Scale) {
    EXPECT_EQ(human_size(0), "0.0B");
    EXPECT_EQ(human_size(512), "512.0B");
    EXPECT_EQ(human_size(1536), "1.5KB");
    EXPECT_EQ(human_size(200ULL * 1024 * 1024), "200.0MB");
    EXPECT_EQ(human_size(3ULL * 1024 * 1024 * 1024), "3.0GB");
}

TEST(ReportTest, HumanSize_BeyondTerabytes) {
    EXPECT_EQ(human_size(2048ULL * 1024 * 1024 * 1024 * 1024), "2.0PB");
}

// ==============================================================================
// render_summary
// ==============================================================================

TEST(ReportTest, Summary_OmitsZeroCounters) {
    ingest::RunStatistics stats;
    stats.total_files = 2;
    stats.processed = 2;

    std::string s = render_summary(stats, "/tmp/out.txt", 2048, false);

    EXPECT_EQ(s,
              "\n\nSummary:\n"
              "  Files discovered: 2\n"
              "  Files processed:  2\n"
              "  Output file: /tmp/out.txt  (size: 2.0KB)\n"
              "\nDone.\n");
}

TEST(ReportTest, Summary_AllCounters) {
    ingest::RunStatistics stats;
    stats.total_files = 6;
    stats.processed = 1;
    stats.skipped_binary = 2;
    stats.skipped_large = 1;
    stats.errors = 2;

    std::string s = render_summary(stats, "/tmp/out.txt", std::nullopt, false);

    EXPECT_NE(s.find("  Skipped (binary-like): 2\n"), std::string::npos);
    EXPECT_NE(s.find("  Skipped (too large): 1\n"), std::string::npos);
    EXPECT_NE(s.find("  Errors: 2\n"), std::string::npos);
    EXPECT_NE(s.find("  Output file: /tmp/out.txt\n"), std::string::npos);
    EXPECT_EQ(s.find("size:"), std::string::npos);
}

TEST(ReportTest, Summary_EncodingReportLimited) {
    ingest::RunStatistics stats;
    stats.total_files = 12;
    stats.processed = 12;
    for (int i = 0; i < 12; ++i) {
        stats.encodings.emplace_back("/d/f" + std::to_string(i) + ".txt", "utf-8");
    }

    std::string s = render_summary(stats, "/tmp/out.txt", 10, true);

    EXPECT_NE(s.find("\nEncodings detected (sample):\n"), std::string::npos);
    EXPECT_NE(s.find("  /d/f0.txt -> utf-8\n"), std::string::npos);
    EXPECT_NE(s.find("  /d/f9.txt -> utf-8\n"), std::string::npos);
    EXPECT_EQ(s.find("/d/f10.txt"), std::string::npos);
    EXPECT_NE(s.find("  ... and 2 more\n"), std::string::npos);
}

TEST(ReportTest, Summary_EncodingReportDisabled) {
    ingest::RunStatistics stats;
    stats.encodings.emplace_back("/d/a.txt", "latin-1");

    std::string s = render_summary(stats, "/tmp/out.txt", 10, false);

    EXPECT_EQ(s.find("Encodings"), std::string::npos);
}

// ==============================================================================
// summary_to_json
// ==============================================================================

TEST(ReportTest, Json_Fields) {
    ingest::RunStatistics stats;
    stats.total_files = 3;
    stats.processed = 1;
    stats.skipped_binary = 1;
    stats.errors = 1;
    stats.encodings.emplace_back("/d/a.txt", "cp1252");

    rapidjson::Document doc;
    summary_to_json(stats, "/tmp/out.txt", doc);

    ASSERT_TRUE(doc.IsObject());
    EXPECT_EQ(doc["files_discovered"].GetUint64(), 3u);
    EXPECT_EQ(doc["processed"].GetUint64(), 1u);
    EXPECT_EQ(doc["skipped_binary"].GetUint64(), 1u);
    EXPECT_EQ(doc["skipped_large"].GetUint64(), 0u);
    EXPECT_EQ(doc["errors"].GetUint64(), 1u);
    EXPECT_STREQ(doc["output"].GetString(), "/tmp/out.txt");
    ASSERT_TRUE(doc["encodings"].IsArray());
    ASSERT_EQ(doc["encodings"].Size(), 1u);
    EXPECT_STREQ(doc["encodings"][0u]["path"].GetString(), "/d/a.txt");
    EXPECT_STREQ(doc["encodings"][0u]["encoding"].GetString(), "cp1252");
}

}  // namespace collector::report::test
