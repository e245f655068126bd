#include "../AppConfig.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace ff;

TEST(AppConfigTest, Defaults) {
  AppConfig config;
  EXPECT_EQ(config.database, "ledger.db");
  EXPECT_TRUE(config.owner.empty());
  EXPECT_EQ(config.logLevel, "warning");
  EXPECT_EQ(config.busyTimeoutMs, 5000);
}

TEST(AppConfigTest, ReadsKnownFields) {
  AppConfig config;
  nlohmann::json j = {{"database", "/tmp/books.db"},
                      {"owner", "alice"},
                      {"logLevel", "debug"},
                      {"busyTimeoutMs", 250}};
  auto parsed = config.ltsFromJson(j);
  ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
  EXPECT_EQ(config.database, "/tmp/books.db");
  EXPECT_EQ(config.owner, "alice");
  EXPECT_EQ(config.logLevel, "debug");
  EXPECT_EQ(config.busyTimeoutMs, 250);
  EXPECT_TRUE(config.logFile.empty());
}

TEST(AppConfigTest, RejectsWrongTypes) {
  AppConfig config;
  EXPECT_TRUE(config.ltsFromJson(nlohmann::json::array()).isError());
  EXPECT_TRUE(config.ltsFromJson({{"database", 5}}).isError());
  EXPECT_TRUE(config.ltsFromJson({{"database", ""}}).isError());
  EXPECT_TRUE(config.ltsFromJson({{"owner", true}}).isError());
  EXPECT_TRUE(config.ltsFromJson({{"logLevel", "loud"}}).isError());
  EXPECT_TRUE(config.ltsFromJson({{"busyTimeoutMs", -1}}).isError());
  EXPECT_TRUE(config.ltsFromJson({{"busyTimeoutMs", "10"}}).isError());

  auto err = config.ltsFromJson({{"logFile", 1}});
  ASSERT_TRUE(err.isError());
  EXPECT_EQ(err.error().code, AppConfig::E_CONFIG);
}

TEST(AppConfigTest, RoundTripsThroughJson) {
  AppConfig config;
  config.owner = "bob";
  config.logFile = "ledger.log";
  AppConfig copy;
  ASSERT_TRUE(copy.ltsFromJson(config.ltsToJson()).isOk());
  EXPECT_EQ(copy.owner, "bob");
  EXPECT_EQ(copy.logFile, "ledger.log");
}

TEST(AppConfigTest, LoadFile) {
  std::string path = ::testing::TempDir() + "ff_ledger_config.json";
  {
    std::ofstream out(path);
    out << R"({"owner": "carol", "logLevel": "info"})";
  }
  auto loaded = AppConfig::loadFile(path);
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(loaded->owner, "carol");
  EXPECT_EQ(loaded->database, "ledger.db");
  std::remove(path.c_str());

  auto missing = AppConfig::loadFile(path);
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, AppConfig::E_CONFIG);
}
