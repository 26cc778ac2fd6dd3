/**
 * @file test_token_cache.cpp
 * @brief Unit tests for the file-backed token cache.
 */

#include "sandbox/token_cache.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace sandbox_runner;

class TokenCacheTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    std::filesystem::path path_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "sr_test_tokens";
        std::filesystem::remove_all(dir_);
        path_ = dir_ / "state" / "tokens.toml";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(TokenCacheTest, MissingFileIsEmpty) {
    TokenCache cache(path_);
    EXPECT_FALSE(cache.get("sbx-1").has_value());
    auto ids = cache.list();
    ASSERT_TRUE(ids.has_value());
    EXPECT_TRUE(ids->empty());
}

TEST_F(TokenCacheTest, SetGetRemove) {
    TokenCache cache(path_);
    ASSERT_TRUE(cache.set("sbx-1", "token-a").has_value());
    ASSERT_TRUE(cache.set("sbx-2", "token-b").has_value());

    EXPECT_EQ(cache.get("sbx-1"), "token-a");
    EXPECT_EQ(cache.get("sbx-2"), "token-b");

    ASSERT_TRUE(cache.remove("sbx-1").has_value());
    EXPECT_FALSE(cache.get("sbx-1").has_value());

    auto ids = cache.list();
    ASSERT_TRUE(ids.has_value());
    EXPECT_EQ(*ids, std::vector<InstanceId>{"sbx-2"});
}

TEST_F(TokenCacheTest, OverwriteReplacesToken) {
    TokenCache cache(path_);
    ASSERT_TRUE(cache.set("sbx-1", "old").has_value());
    ASSERT_TRUE(cache.set("sbx-1", "new").has_value());
    EXPECT_EQ(cache.get("sbx-1"), "new");
}

TEST_F(TokenCacheTest, SecondInstanceSeesWrites) {
    TokenCache writer(path_);
    TokenCache reader(path_);
    ASSERT_TRUE(writer.set("sbx-9", "shared").has_value());
    EXPECT_EQ(reader.get("sbx-9"), "shared");
}

TEST_F(TokenCacheTest, ClearRemovesEverything) {
    TokenCache cache(path_);
    ASSERT_TRUE(cache.set("a", "1").has_value());
    ASSERT_TRUE(cache.set("b", "2").has_value());
    ASSERT_TRUE(cache.clear().has_value());
    EXPECT_TRUE(cache.list()->empty());
}

TEST_F(TokenCacheTest, FileIsPrivate) {
    TokenCache cache(path_);
    ASSERT_TRUE(cache.set("sbx-1", "secret").has_value());

    using std::filesystem::perms;
    auto mode = std::filesystem::status(path_).permissions();
    EXPECT_EQ(mode & (perms::group_all | perms::others_all), perms::none);
    EXPECT_NE(mode & perms::owner_read, perms::none);
}

TEST_F(TokenCacheTest, CorruptFileTreatedAsEmpty) {
    std::filesystem::create_directories(path_.parent_path());
    {
        std::ofstream out(path_);
        out << "this is [not toml";
    }

    TokenCache cache(path_);
    EXPECT_FALSE(cache.get("anything").has_value());
    ASSERT_TRUE(cache.set("sbx-1", "fresh").has_value());
    EXPECT_EQ(cache.get("sbx-1"), "fresh");
}
