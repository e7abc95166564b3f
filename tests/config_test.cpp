#include "motd/common/config_helpers.hpp"
#include "motd/query_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using motd::config::ReadBoolConfig;
using motd::config::ReadQueryOptions;
using motd::config::ReadUInt16Config;
using motd::config::ReadUInt32Config;
using motd::config::ResolvePath;

TEST(ConfigHelpersTest, ResolvesDottedPaths) {
    const auto root = motd::json::Parse(R"({"query": {"TimeoutMs": 250, "nested": {"x": true}}})");
    ASSERT_NE(ResolvePath(root, "query.TimeoutMs"), nullptr);
    EXPECT_EQ(ResolvePath(root, "query.TimeoutMs")->get<int>(), 250);
    EXPECT_NE(ResolvePath(root, "query.nested.x"), nullptr);
    EXPECT_EQ(ResolvePath(root, "query.missing"), nullptr);
    EXPECT_EQ(ResolvePath(root, "query.TimeoutMs.deeper"), nullptr);
    EXPECT_EQ(ResolvePath(root, "query..TimeoutMs"), nullptr);
}

TEST(ConfigHelpersTest, TypedReadersFallBack) {
    const auto root = motd::json::Parse(R"({
        "flag": "yes", "badFlag": "maybe",
        "port": "19133", "zeroPort": 0, "bigPort": 70000,
        "timeout": 0, "negative": -5
    })");
    EXPECT_TRUE(ReadBoolConfig(root, "flag", false));
    EXPECT_FALSE(ReadBoolConfig(root, "badFlag", false));
    EXPECT_TRUE(ReadBoolConfig(root, "absent", true));

    EXPECT_EQ(ReadUInt16Config(root, "port", 1), 19133);
    EXPECT_EQ(ReadUInt16Config(root, "zeroPort", 1), 1);
    EXPECT_EQ(ReadUInt16Config(root, "bigPort", 1), 1);

    EXPECT_EQ(ReadUInt32Config(root, "timeout", 99), 0u);
    EXPECT_EQ(ReadUInt32Config(root, "negative", 99), 99u);
}

TEST(QueryConfigTest, OverridesOnlyPresentKeys) {
    const auto root = motd::json::Parse(R"({"query": {"TimeoutMs": 1500, "ValidateMagic": false}})");
    const auto options = ReadQueryOptions(root);
    EXPECT_EQ(options.timeout.count(), 1500);
    EXPECT_FALSE(options.validateMagic);
    EXPECT_EQ(options.defaultPort, 19132);
}

TEST(QueryConfigTest, LoadJsonFileFromDisk) {
    const std::string path = ::testing::TempDir() + "motd_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"query": {"DefaultPort": 19140}})";
    }
    const auto loaded = motd::config::LoadJsonFile(path, "test config", spdlog::level::err);
    std::remove(path.c_str());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(ReadQueryOptions(*loaded).defaultPort, 19140);

    EXPECT_FALSE(motd::config::LoadJsonFile(path, "test config", spdlog::level::debug).has_value());
}
