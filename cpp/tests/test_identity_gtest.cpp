// ==============================================================================
// test_identity_gtest.cpp - Тесты ключей идентичности (GoogleTest)
// ==============================================================================

#include "collector/identity.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace collector::io::test {

class IdentityTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("collector_identity_") + test_info->name() + "_" +
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
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path) {
        std::ofstream file(path);
        file << "test content";
    }
};

// ==============================================================================
// IdentityKey
// ==============================================================================

TEST(IdentityKeyTest, ToString_Inode) {
    EXPECT_EQ(IdentityKey::from_inode(66306, 1234).to_string(), "inode:66306:1234");
}

TEST(IdentityKeyTest, ToString_Path) {
    EXPECT_EQ(IdentityKey::from_path("/data/a.txt").to_string(), "path:/data/a.txt");
}

TEST(IdentityKeyTest, Equality_KindMatters) {
    EXPECT_EQ(IdentityKey::from_inode(1, 2), IdentityKey::from_inode(1, 2));
    EXPECT_NE(IdentityKey::from_inode(1, 2), IdentityKey::from_inode(1, 3));
    EXPECT_NE(IdentityKey::from_path("x"), IdentityKey::from_inode(0, 0));
}

TEST(IdentityKeyTest, HashSet_DeduplicatesEqualKeys) {
    std::unordered_set<IdentityKey, IdentityKeyHash> seen;

    EXPECT_TRUE(seen.insert(IdentityKey::from_inode(7, 42)).second);
    EXPECT_FALSE(seen.insert(IdentityKey::from_inode(7, 42)).second);
    EXPECT_TRUE(seen.insert(IdentityKey::from_path("/a")).second);
    EXPECT_FALSE(seen.insert(IdentityKey::from_path("/a")).second);
    EXPECT_EQ(seen.size(), 2u);
}

// ==============================================================================
// key_for
// ==============================================================================

TEST_F(IdentityTest, KeyFor_MissingEntry_FallsBackToPath) {
    auto missing = test_dir_ / "missing.txt";

    IdentityKey key = key_for(missing, false);

    EXPECT_EQ(key.kind, IdentityKey::Kind::Path);
    EXPECT_NE(key.path.find("missing.txt"), std::string::npos);
}

TEST_F(IdentityTest, KeyFor_SameFileDifferentSpelling_SameKey) {
    create_file(test_dir_ / "a.txt");

    IdentityKey direct = key_for(test_dir_ / "a.txt", false);
    IdentityKey dotted = key_for(test_dir_ / "." / "a.txt", false);

    EXPECT_EQ(direct, dotted);
}

#ifndef _WIN32
TEST_F(IdentityTest, KeyFor_ExistingFile_UsesInode) {
    create_file(test_dir_ / "a.txt");

    IdentityKey key = key_for(test_dir_ / "a.txt", false);

    EXPECT_EQ(key.kind, IdentityKey::Kind::Inode);
}

TEST_F(IdentityTest, KeyFor_HardLink_SameKey) {
    create_file(test_dir_ / "a.txt");
    std::filesystem::create_hard_link(test_dir_ / "a.txt", test_dir_ / "b.txt");

    EXPECT_EQ(key_for(test_dir_ / "a.txt", false), key_for(test_dir_ / "b.txt", false));
}

TEST_F(IdentityTest, KeyFor_Symlink_FollowDecidesTarget) {
    create_file(test_dir_ / "target.txt");
    std::filesystem::create_symlink(test_dir_ / "target.txt", test_dir_ / "link.txt");

    IdentityKey target = key_for(test_dir_ / "target.txt", false);

    EXPECT_EQ(key_for(test_dir_ / "link.txt", true), target);
    EXPECT_NE(key_for(test_dir_ / "link.txt", false), target);
}

TEST_F(IdentityTest, KeyFor_DanglingSymlinkFollowed_FallsBackToPath) {
    std::filesystem::create_symlink(test_dir_ / "nowhere", test_dir_ / "dangling");

    IdentityKey key = key_for(test_dir_ / "dangling", true);

    EXPECT_EQ(key.kind, IdentityKey::Kind::Path);
}
#endif

}  // namespace collector::io::test
