#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "config_manager.hpp"

using namespace callgate::engine::common;

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Create a temporary test config file
    test_config_path_ = std::filesystem::temp_directory_path() / "callgate_test_config.json";

    nlohmann::json config = {
      {"app", {
        {"log", {
          {"file", "test.log"},
          {"level", "debug"}
        }}
      }},
      {"throttle", {
        {"drain_interval_ms", 250},
        {"retry_delay_ms", -5},
        {"default_capacity", 80}
      }},
      {"shop", {
        {"base_url", "https://test-shop.myshopify.com"},
        {"access_token", "shpat_secret"}
      }},
      {"test_int", 42},
      {"test_string", "hello"},
      {"test_null", nullptr}
    };

    std::ofstream file(test_config_path_);
    file << config.dump(2);
    file.close();
  }

  void TearDown() override {
    if (std::filesystem::exists(test_config_path_)) {
      std::filesystem::remove(test_config_path_);
    }
  }

  std::filesystem::path test_config_path_;
};

TEST_F(ConfigManagerTest, LoadFromFile_Success) {
  ConfigManager config;
  EXPECT_TRUE(config.LoadFromFile(test_config_path_.string()));
}

TEST_F(ConfigManagerTest, LoadFromFile_NonExistent) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromFile("/nonexistent/file.json"));
}

TEST_F(ConfigManagerTest, LoadFromString_Invalid) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromString("{not json"));
  EXPECT_FALSE(config.LoadFromString("[1, 2, 3]"));
  EXPECT_TRUE(config.LoadFromString("{\"a\": 1}"));
}

TEST_F(ConfigManagerTest, GetString_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("test_string"), "hello");
  EXPECT_EQ(config.GetString("app.log.file"), "test.log");
  EXPECT_EQ(config.GetString("shop.base_url"), "https://test-shop.myshopify.com");
}

TEST_F(ConfigManagerTest, GetString_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("nonexistent"), "");
  EXPECT_EQ(config.GetString("nonexistent", "default"), "default");
  EXPECT_EQ(config.GetString("test_string.deeper", "default"), "default");
}

TEST_F(ConfigManagerTest, GetString_WrongType) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("test_int", "default"), "default");
}

TEST_F(ConfigManagerTest, GetInt_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("test_int"), 42);
  EXPECT_EQ(config.GetInt("throttle.default_capacity"), 80);
}

TEST_F(ConfigManagerTest, GetInt_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("nonexistent"), 0);
  EXPECT_EQ(config.GetInt("nonexistent", 99), 99);
}

TEST_F(ConfigManagerTest, GetMilliseconds) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetMilliseconds("throttle.drain_interval_ms", std::chrono::milliseconds(500)),
            std::chrono::milliseconds(250));
  EXPECT_EQ(config.GetMilliseconds("nonexistent", std::chrono::milliseconds(500)),
            std::chrono::milliseconds(500));
  // Negative values fall back to the default
  EXPECT_EQ(config.GetMilliseconds("throttle.retry_delay_ms", std::chrono::milliseconds(500)),
            std::chrono::milliseconds(500));
}

TEST_F(ConfigManagerTest, Has) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_TRUE(config.Has("shop.access_token"));
  EXPECT_TRUE(config.Has("throttle"));
  EXPECT_FALSE(config.Has("test_null"));
  EXPECT_FALSE(config.Has("shop.missing"));

  config.SetString("shop.missing", "now present");
  EXPECT_TRUE(config.Has("shop.missing"));
}

TEST_F(ConfigManagerTest, SetString_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetString("test_string", "overridden");
  EXPECT_EQ(config.GetString("test_string"), "overridden");
}

TEST_F(ConfigManagerTest, Override_WithoutLoadedFile) {
  ConfigManager config;
  EXPECT_EQ(config.GetString("shop.base_url", "none"), "none");
  config.SetString("shop.base_url", "http://127.0.0.1:9000");
  EXPECT_EQ(config.GetString("shop.base_url"), "http://127.0.0.1:9000");
}

TEST_F(ConfigManagerTest, PrintAllConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  // Should not throw
  config.PrintAllConfig();
}
