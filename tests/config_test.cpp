#include <gtest/gtest.h>

#include "core/config/config.hpp"
#include "test_support.hpp"

#include <filesystem>

using namespace cue;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
  cue::testing::TempDir dir;

  Config load(const std::string &json) {
    std::string path = dir.touch("config.json", json);
    return Config(path);
  }
};

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
  std::string path = dir.file("nested/cue/config.json");
  Config config(path);
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(config.path(), path);

  Settings s = config.settings();
  EXPECT_EQ(s.driver_mode, DriverMode::Precise);
  EXPECT_EQ(s.player_executable, "mpv");
  EXPECT_TRUE(s.ipc_socket_path.empty());
  EXPECT_DOUBLE_EQ(s.sample_interval_seconds, 5.0);
  EXPECT_DOUBLE_EQ(s.completion_threshold, 0.98);
  EXPECT_TRUE(s.recursive);
  EXPECT_EQ(s.connect_timeout, 5000ms);
  EXPECT_EQ(s.extensions, Settings().extensions);
  EXPECT_TRUE(config.get_notifications_enabled());
  EXPECT_EQ(config.get_log_level(), log::Level::Info);

  // Reading the written file back gives the same settings.
  Settings again = Config(path).settings();
  EXPECT_EQ(again.player_executable, s.player_executable);
  EXPECT_EQ(again.extensions, s.extensions);
  EXPECT_EQ(again.store_write_retries, s.store_write_retries);
}

TEST_F(ConfigTest, CoarseModeDefaultsToVlc) {
  Settings s = load(R"({"player": {"mode": "coarse", "executable": "", "extra_args": []}})")
                   .settings();
  EXPECT_EQ(s.driver_mode, DriverMode::Coarse);
  EXPECT_EQ(s.player_executable, "vlc");
  EXPECT_EQ(s.extra_args, std::vector<std::string>{"--play-and-exit"});
  EXPECT_EQ(s.start_offset_arg, "--start-time={}");
}

TEST_F(ConfigTest, ExplicitValuesWin) {
  Config config = load(R"({
    "player": {"mode": "coarse", "executable": "/opt/player", "extra_args": ["--fs"],
               "start_offset_arg": "+{}"},
    "resume": {"sample_interval_seconds": 2.5, "completion_threshold": 0.9,
               "recursive": false, "extensions": [".mkv"]},
    "ipc": {"connect_timeout_ms": 800},
    "storage": {"path": "/srv/cue/sessions.json", "write_retries": 5},
    "ui": {"show_notifications": false},
    "log": {"level": "debug"}
  })");
  Settings s = config.settings();
  EXPECT_EQ(s.player_executable, "/opt/player");
  EXPECT_EQ(s.extra_args, std::vector<std::string>{"--fs"});
  EXPECT_EQ(s.start_offset_arg, "+{}");
  EXPECT_DOUBLE_EQ(s.sample_interval_seconds, 2.5);
  EXPECT_EQ(s.sample_interval(), 2500ms);
  EXPECT_DOUBLE_EQ(s.completion_threshold, 0.9);
  EXPECT_FALSE(s.recursive);
  EXPECT_EQ(s.extensions, std::vector<std::string>{".mkv"});
  EXPECT_EQ(s.connect_timeout, 800ms);
  EXPECT_EQ(s.query_timeout, 2000ms);
  EXPECT_EQ(s.store_write_retries, 5);
  EXPECT_EQ(config.get_store_path(), "/srv/cue/sessions.json");
  EXPECT_FALSE(config.get_notifications_enabled());
  EXPECT_EQ(config.get_log_level(), log::Level::Debug);
}

TEST_F(ConfigTest, InvalidValuesFallBack) {
  Settings s = load(R"({
    "player": {"mode": "telepathic"},
    "resume": {"sample_interval_seconds": -1, "completion_threshold": 1.5,
               "recursive": "yes"},
    "ipc": {"query_timeout_ms": 0, "quit_timeout_ms": "soon"}
  })").settings();
  EXPECT_EQ(s.driver_mode, DriverMode::Precise);
  EXPECT_DOUBLE_EQ(s.sample_interval_seconds, 5.0);
  EXPECT_DOUBLE_EQ(s.completion_threshold, 0.98);
  EXPECT_TRUE(s.recursive);
  EXPECT_EQ(s.query_timeout, 2000ms);
  EXPECT_EQ(s.quit_timeout, 2000ms);
}

TEST_F(ConfigTest, EmptyStorePathUsesDataDir) {
  Config config = load(R"({"storage": {"path": ""}})");
  EXPECT_EQ(config.get_store_path(), paths::get_data_dir() + "/sessions.json");
}

TEST_F(ConfigTest, UnreadableFileFallsBackToDefaults) {
  Config config = load("{ this is not json");
  Settings s = config.settings();
  EXPECT_EQ(s.driver_mode, DriverMode::Precise);
  EXPECT_EQ(s.player_executable, "mpv");
  EXPECT_EQ(config.get_log_level(), log::Level::Info);
}

TEST_F(ConfigTest, ZeroRetriesMeansOneAttempt) {
  EXPECT_EQ(load(R"({"storage": {"write_retries": 0}})").settings().store_write_retries, 0);
  EXPECT_EQ(load(R"({"storage": {"write_retries": -3}})").settings().store_write_retries, 0);
}
