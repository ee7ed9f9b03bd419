#include "dmxconsole.h"

#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

namespace {

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("dmxconsole_config_test_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    std::filesystem::create_directories(dir_);
    path_ = (dir_ / "config.json").string();
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  void write(const std::string& content) {
    std::ofstream out(path_);
    out << content;
  }

  std::filesystem::path dir_;
  std::string path_;
};

}  // namespace

TEST_F(ConfigManagerTest, MissingFileKeepsDefaults) {
  ConfigManager cm(path_);
  EXPECT_FALSE(cm.load());
  EXPECT_EQ("http://127.0.0.1:8000", cm.get().server_url);
  EXPECT_DOUBLE_EQ(2.0, cm.get().watch_interval_s);
  EXPECT_TRUE(cm.get().follow_tail);
}

TEST_F(ConfigManagerTest, MalformedFileKeepsDefaults) {
  write("{ not json");
  ConfigManager cm(path_);
  EXPECT_FALSE(cm.load());
  EXPECT_EQ(50, cm.get().log_view_page_size);
}

TEST_F(ConfigManagerTest, WrongTypeKeepsDefaults) {
  write(R"({"server_url": "http://bridge:9000", "watch_interval_s": "fast"})");
  ConfigManager cm(path_);
  EXPECT_FALSE(cm.load());
  EXPECT_EQ("http://127.0.0.1:8000", cm.get().server_url);
}

TEST_F(ConfigManagerTest, OverflowingNumberKeepsDefaults) {
  write(R"({"watch_interval_s": 1e400})");
  ConfigManager cm(path_);
  EXPECT_FALSE(cm.load());
  EXPECT_DOUBLE_EQ(2.0, cm.get().watch_interval_s);
}

TEST_F(ConfigManagerTest, LoadsAndClampsValues) {
  write(R"({
    "server_url": "http://bridge.local:8000/",
    "watch_interval_s": 0.1,
    "log_view_page_size": 0,
    "follow_tail": false
  })");
  ConfigManager cm(path_);
  EXPECT_TRUE(cm.load());
  EXPECT_EQ("http://bridge.local:8000", cm.get().server_url);
  EXPECT_DOUBLE_EQ(0.5, cm.get().watch_interval_s);
  EXPECT_EQ(1, cm.get().log_view_page_size);
  EXPECT_FALSE(cm.get().follow_tail);
  EXPECT_DOUBLE_EQ(1.0, cm.get().tail_poll_interval_s);
}

TEST_F(ConfigManagerTest, SaveThenLoadKeepsValues) {
  ConfigManager cm(path_);
  cm.get().server_url = "http://10.0.0.5:8000";
  cm.get().log_view_page_size = 25;
  ASSERT_TRUE(cm.save());

  ConfigManager reloaded(path_);
  ASSERT_TRUE(reloaded.load());
  EXPECT_EQ("http://10.0.0.5:8000", reloaded.get().server_url);
  EXPECT_EQ(25, reloaded.get().log_view_page_size);
}
