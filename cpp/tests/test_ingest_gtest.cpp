// ==============================================================================
// test_ingest_gtest.cpp - Тесты конвейера сборки (GoogleTest)
// ==============================================================================
//
// Лимит размера, бинарные файлы, заголовки, потоковое декодирование,
// исключение файла результата, путь результата.
//
// ==============================================================================

#include "collector/ingest.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace collector::ingest::test {

// ==============================================================================
// Test Fixture
// ==============================================================================

class CountingProgress : public output::ProgressReporter {
public:
    void advance(std::size_t n) override { advanced += n; }
    void finish() override { ++finished; }

    std::size_t advanced = 0;
    int finished = 0;
};

class IngestTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    output::OutputConfig log_cfg_;
    std::unique_ptr<output::Writer> log_;
    CountingProgress progress_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("collector_ingest_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);

        log_cfg_.quiet = true;
        log_ = std::make_unique<output::Writer>(log_cfg_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_bytes(const std::string& name, const std::string& bytes) {
        std::filesystem::path p = test_dir_ / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        return p;
    }

    RunStatistics run(const std::vector<std::filesystem::path>& files, output::Sink& sink,
                      const IngestOptions& opt = IngestOptions{}) {
        return ingest_files(files, sink, opt, progress_, *log_);
    }
};

// ==============================================================================
// Форматирование
// ==============================================================================

TEST(IngestFormatTest, FileHeader) {
    EXPECT_EQ(format_file_header(std::filesystem::path("/data/a.txt")),
              "\n\n----\n/data/a.txt\n");
}

TEST(IngestFormatTest, RunBanner) {
    EXPECT_EQ(format_run_banner("2026-01-02 03:04:05"),
              "# Collected files output generated on 2026-01-02 03:04:05\n");
}

// ==============================================================================
// Обработка файлов
// ==============================================================================

TEST_F(IngestTest, TextFile_HeaderThenContent) {
    // Arrange
    auto a = write_bytes("a.txt", "hello\nworld\n");
    output::StringSink sink;

    // Act
    RunStatistics stats = run({a}, sink);

    // Assert
    EXPECT_EQ(stats.total_files, 1u);
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str(), format_file_header(a) + "hello\nworld\n");
    EXPECT_EQ(progress_.advanced, 1u);
}

TEST_F(IngestTest, BinaryFile_SkippedWithoutHeader) {
    auto bin = write_bytes("b.bin", std::string("\x00\x01\x02", 3));
    output::StringSink sink;

    RunStatistics stats = run({bin}, sink);

    EXPECT_EQ(stats.skipped_binary, 1u);
    EXPECT_EQ(stats.processed, 0u);
    EXPECT_TRUE(sink.str().empty());
}

TEST_F(IngestTest, LargeFile_SkippedStrictlyAboveLimit) {
    auto big = write_bytes("big.txt", "123456");
    auto exact = write_bytes("exact.txt", "12345");
    output::StringSink sink;
    IngestOptions opt;
    opt.max_size_bytes = 5;

    RunStatistics stats = run({big, exact}, sink, opt);

    EXPECT_EQ(stats.skipped_large, 1u);
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str(), format_file_header(exact) + "12345");
}

TEST_F(IngestTest, NoLimit_ProcessesEverything) {
    auto big = write_bytes("big.txt", std::string(100000, 'x'));
    output::StringSink sink;

    RunStatistics stats = run({big}, sink);

    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str().size(), format_file_header(big).size() + 100000u);
}

TEST_F(IngestTest, EmptyFile_HeaderOnlyUnknownEncoding) {
    auto empty = write_bytes("empty.txt", "");
    output::StringSink sink;
    IngestOptions opt;
    opt.record_encodings = true;

    RunStatistics stats = run({empty}, sink, opt);

    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str(), format_file_header(empty));
    ASSERT_EQ(stats.encodings.size(), 1u);
    EXPECT_EQ(stats.encodings[0].second, "unknown");
}

TEST_F(IngestTest, MissingFile_CountedAsError) {
    auto good = write_bytes("good.txt", "ok");
    output::StringSink sink;

    RunStatistics stats = run({test_dir_ / "vanished.txt", good}, sink);

    EXPECT_EQ(stats.errors, 1u);
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(progress_.advanced, 2u);
    EXPECT_EQ(sink.str(), format_file_header(good) + "ok");
}

TEST_F(IngestTest, Latin1File_TranscodedToUtf8) {
    auto f = write_bytes("latin.txt", "caf\xE9");
    output::StringSink sink;
    IngestOptions opt;
    opt.record_encodings = true;

    RunStatistics stats = run({f}, sink, opt);

    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str(), format_file_header(f) + "caf\xC3\xA9");
    ASSERT_EQ(stats.encodings.size(), 1u);
    EXPECT_EQ(stats.encodings[0].second, "latin-1");
}

TEST_F(IngestTest, Utf8SequenceAcrossSampleBoundary_Preserved) {
    // Arrange - C3 последний байт выборки, A9 первый байт следующего чанка
    std::string content(kSampleBytes - 1, 'a');
    content += "\xC3\xA9tail";
    auto f = write_bytes("boundary.txt", content);
    output::StringSink sink;
    IngestOptions opt;
    opt.record_encodings = true;

    // Act
    RunStatistics stats = run({f}, sink, opt);

    // Assert
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str(), format_file_header(f) + content);
    ASSERT_EQ(stats.encodings.size(), 1u);
    EXPECT_EQ(stats.encodings[0].second, "utf-8");
}

TEST_F(IngestTest, Utf16LeWithBom_LeadByteAtEndNotCarried) {
    // Arrange - U+C548 в UTF-16LE: последний байт C5 похож на начало UTF-8
    auto f = write_bytes("hangul.txt", "\xFF\xFE\x48\xC5");
    output::StringSink sink;
    IngestOptions opt;
    opt.record_encodings = true;

    // Act
    RunStatistics stats = run({f}, sink, opt);

    // Assert
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(sink.str(), format_file_header(f) + "\xEC\x95\x88");
    ASSERT_EQ(stats.encodings.size(), 1u);
    EXPECT_EQ(stats.encodings[0].second, "utf-16");
}

TEST_F(IngestTest, EncodingsRecordedInProcessingOrder) {
    auto a = write_bytes("a.txt", "x");
    auto b = write_bytes("b.txt", "y");
    output::StringSink sink;
    IngestOptions opt;
    opt.record_encodings = true;

    RunStatistics stats = run({b, a}, sink, opt);

    ASSERT_EQ(stats.encodings.size(), 2u);
    EXPECT_NE(stats.encodings[0].first.find("b.txt"), std::string::npos);
    EXPECT_NE(stats.encodings[1].first.find("a.txt"), std::string::npos);
}

TEST_F(IngestTest, EncodingsNotRecordedByDefault) {
    auto a = write_bytes("a.txt", "x");
    output::StringSink sink;

    RunStatistics stats = run({a}, sink);

    EXPECT_TRUE(stats.encodings.empty());
}

// ==============================================================================
// Сквозной сценарий
// ==============================================================================

#ifndef _WIN32
TEST_F(IngestTest, EndToEnd_LoopBinaryAndText) {
    // Arrange
    write_bytes("a.txt", "hello");
    write_bytes("b.bin", std::string("\x00\x01\x02", 3));
    std::filesystem::create_directory_symlink(test_dir_, test_dir_ / "loop");
    io::DiscoveryOptions dopt;
    dopt.follow_symlinks = true;
    output::StringSink sink;

    // Act
    auto files = gather_file_list({test_dir_}, dopt);
    RunStatistics stats = run(files, sink);

    // Assert
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(stats.total_files, 2u);
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(stats.skipped_binary, 1u);
    EXPECT_EQ(sink.str(), format_file_header(test_dir_ / "a.txt") + "hello");
}
#endif

// ==============================================================================
// Файл результата
// ==============================================================================

TEST_F(IngestTest, ExcludeOutputFile_RemovesSameFile) {
    auto a = write_bytes("a.txt", "x");
    auto out = write_bytes("out.txt", "");

    auto files = exclude_output_file({a, out}, test_dir_ / "." / "out.txt");

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], a);
}

TEST_F(IngestTest, ExcludeOutputFile_NotYetCreated) {
    auto a = write_bytes("a.txt", "x");

    auto files = exclude_output_file({a}, test_dir_ / "out.txt");

    EXPECT_EQ(files.size(), 1u);
}

TEST_F(IngestTest, PrepareOutputPath_ExistingDirectory) {
    auto p = prepare_output_path(test_dir_, "20260102_030405");

    EXPECT_EQ(p, test_dir_ / "collected_files_20260102_030405.txt");
}

TEST_F(IngestTest, PrepareOutputPath_CreatesParents) {
    auto target = test_dir_ / "x" / "y" / "out.txt";

    auto p = prepare_output_path(target, "20260102_030405");

    EXPECT_EQ(p, target);
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "x" / "y"));
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(IngestTest, PrepareOutputPath_DefaultInCurrentDirectory) {
    auto p = prepare_output_path(std::nullopt, "20260102_030405");

    EXPECT_EQ(p, std::filesystem::current_path() / "collected_files_20260102_030405.txt");
}

TEST_F(IngestTest, GatherFileList_OnlyRegularFiles) {
    write_bytes("a.txt", "x");
    std::filesystem::create_directories(test_dir_ / "empty_dir");

    auto files = gather_file_list({test_dir_, test_dir_ / "missing"}, io::DiscoveryOptions{});

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], test_dir_ / "a.txt");
}

}  // namespace collector::ingest::test
