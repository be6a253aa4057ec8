#include "core/Config.hpp"
#include "support/TestHelpers.hpp"

#include <gtest/gtest.h>

using harbor::core::Config;
using harbor::test::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::instance().setDefaults(); }
    void TearDown() override { Config::instance().setDefaults(); }
};

TEST_F(ConfigTest, Defaults) {
    auto& config = Config::instance();
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 2);
    EXPECT_EQ(config.get<int>("persistence.debounceMs"), 1000);
    EXPECT_EQ(config.get<std::string>("persistence.key"), "downloads");
    EXPECT_EQ(config.get<int>("cache.ttlSeconds"), 300);
    EXPECT_EQ(config.get<int>("cache.maxEntries"), 50);
    EXPECT_FALSE(config.get<bool>("gallery.enabled", true));
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, SetGetHasRemove) {
    auto& config = Config::instance();

    EXPECT_TRUE(config.set("downloads.maxConcurrent", 4));
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 4);

    EXPECT_FALSE(config.has("custom.value"));
    EXPECT_EQ(config.get<std::string>("custom.value", "fallback"), "fallback");

    config.set("custom.value", std::string("x"));
    EXPECT_TRUE(config.has("custom.value"));

    config.remove("custom.value");
    EXPECT_FALSE(config.has("custom.value"));

    // Wrong type falls back to the default
    EXPECT_EQ(config.get<int>("log.level", 7), 7);
}

TEST_F(ConfigTest, LoadMergesOverDefaults) {
    TempDir dir;
    auto path = dir.file("config.json");
    harbor::test::writeFile(path, R"({"downloads": {"maxConcurrent": 5}, "log": {"level": "debug"}})");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 5);
    EXPECT_EQ(config.get<std::string>("log.level"), "debug");
    EXPECT_EQ(config.get<int>("persistence.debounceMs"), 1000);
}

TEST_F(ConfigTest, LoadRejectsMissingOrInvalidFile) {
    TempDir dir;
    auto& config = Config::instance();

    EXPECT_FALSE(config.load(dir.file("missing.json")));

    auto bad = dir.file("bad.json");
    harbor::test::writeFile(bad, "{ nope");
    EXPECT_FALSE(config.load(bad));
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 2);
}

TEST_F(ConfigTest, SaveWritesReadableFile) {
    TempDir dir;
    auto path = dir.file("sub/config.json");
    auto& config = Config::instance();

    config.set("downloads.maxConcurrent", 3);
    ASSERT_TRUE(config.save(path));

    config.setDefaults();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 3);
}
