// ==============================================================================
// test_collect_gtest.cpp - Тесты прогона сборки (GoogleTest)
// ==============================================================================
//
// Заголовок прогона и append, исключение файла результата,
// пустой список файлов, exit code 3.
//
// ==============================================================================

#include "collector/collect.hpp"

#include "collector/ingest.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace collector::app::test {

// ==============================================================================
// Test Fixture
// ==============================================================================

class CollectTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path input_dir_;
    output::OutputConfig log_cfg_;
    std::unique_ptr<output::Writer> log_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("collector_collect_") + test_info->name() + "_" +
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
        input_dir_ = test_dir_ / "in";
        std::filesystem::create_directories(input_dir_);

        log_cfg_.quiet = true;
        log_ = std::make_unique<output::Writer>(log_cfg_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_text(const std::filesystem::path& p, const std::string& text) {
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << text;
        return p;
    }

    static std::string read_all(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    cli::CollectOptions options_for(const std::filesystem::path& output) {
        cli::CollectOptions opt;
        opt.roots = {input_dir_};
        opt.output = output;
        return opt;
    }

    /// Прогон с перехватом stdout (сводка)
    int run(const cli::CollectOptions& opt, std::string& stdout_text) {
        ::testing::internal::CaptureStdout();
        const int code = run_collect(opt, *log_);
        stdout_text = ::testing::internal::GetCapturedStdout();
        return code;
    }
};

// ==============================================================================
// Файл результата
// ==============================================================================

TEST_F(CollectTest, NewOutput_BannerThenFiles) {
    // Arrange
    auto a = write_text(input_dir_ / "a.txt", "alpha");
    auto out = test_dir_ / "out.txt";
    std::string stdout_text;

    // Act
    int code = run(options_for(out), stdout_text);

    // Assert
    EXPECT_EQ(code, EXIT_OK);
    std::string content = read_all(out);
    EXPECT_EQ(content.rfind("# Collected files output generated on ", 0), 0u);
    const std::string body = ingest::format_file_header(a) + "alpha";
    ASSERT_GE(content.size(), body.size());
    EXPECT_EQ(content.substr(content.size() - body.size()), body);
    EXPECT_NE(stdout_text.find("Files processed:  1"), std::string::npos);
}

TEST_F(CollectTest, Append_ExistingOutput_NoBanner) {
    auto a = write_text(input_dir_ / "a.txt", "alpha");
    auto out = write_text(test_dir_ / "out.txt", "previous\n");
    cli::CollectOptions opt = options_for(out);
    opt.append = true;
    std::string stdout_text;

    int code = run(opt, stdout_text);

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_EQ(read_all(out), "previous\n" + ingest::format_file_header(a) + "alpha");
}

TEST_F(CollectTest, Append_MissingOutput_WritesBanner) {
    write_text(input_dir_ / "a.txt", "alpha");
    auto out = test_dir_ / "fresh.txt";
    cli::CollectOptions opt = options_for(out);
    opt.append = true;
    std::string stdout_text;

    int code = run(opt, stdout_text);

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_EQ(read_all(out).rfind("# Collected files output generated on ", 0), 0u);
}

TEST_F(CollectTest, OutputInsideRoot_NotCollected) {
    // Arrange - результат лежит внутри обходимого корня
    auto a = write_text(input_dir_ / "a.txt", "alpha");
    auto out = write_text(input_dir_ / "out.txt", "stale");
    std::string stdout_text;

    // Act
    int code = run(options_for(out), stdout_text);

    // Assert
    EXPECT_EQ(code, EXIT_OK);
    std::string content = read_all(out);
    EXPECT_NE(content.find(ingest::format_file_header(a)), std::string::npos);
    EXPECT_EQ(content.find(ingest::format_file_header(out)), std::string::npos);
    EXPECT_EQ(content.find("stale"), std::string::npos);
}

TEST_F(CollectTest, EmptyFileList_NoOutputCreated) {
    auto out = test_dir_ / "res" / "out.txt";
    std::string stdout_text;

    int code = run(options_for(out), stdout_text);

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_FALSE(std::filesystem::exists(out));
    EXPECT_NE(stdout_text.find("No files found to process. Exiting."), std::string::npos);
}

TEST_F(CollectTest, Json_SummaryOnStdout) {
    write_text(input_dir_ / "a.txt", "alpha");
    cli::CollectOptions opt = options_for(test_dir_ / "out.txt");
    opt.json = true;
    std::string stdout_text;

    int code = run(opt, stdout_text);

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_NE(stdout_text.find("\"processed\": 1"), std::string::npos);
    EXPECT_NE(stdout_text.find("\"encoding\": \"utf-8\""), std::string::npos);
}

// ==============================================================================
// Ошибки результата
// ==============================================================================

TEST_F(CollectTest, OutputParentIsFile_Exit3) {
    write_text(input_dir_ / "a.txt", "alpha");
    auto blocker = write_text(test_dir_ / "blocker", "x");
    std::string stdout_text;

    int code = run(options_for(blocker / "out.txt"), stdout_text);

    EXPECT_EQ(code, EXIT_OUTPUT);
}

#ifndef _WIN32
TEST_F(CollectTest, OutputNotWritable_Exit3) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }

    // Arrange
    write_text(input_dir_ / "a.txt", "alpha");
    auto locked = test_dir_ / "locked";
    std::filesystem::create_directories(locked);
    std::filesystem::permissions(locked, std::filesystem::perms::owner_read |
                                             std::filesystem::perms::owner_exec);
    std::string stdout_text;

    // Act
    int code = run(options_for(locked / "out.txt"), stdout_text);

    // Assert
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
    EXPECT_EQ(code, EXIT_OUTPUT);
    EXPECT_FALSE(std::filesystem::exists(locked / "out.txt"));
}
#endif

}  // namespace collector::app::test
