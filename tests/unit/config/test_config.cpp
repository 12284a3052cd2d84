#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "bflow/config/config.hpp"
#include "test_helpers.hpp"

using namespace bflow::config;
using namespace bflow::test;
using bflow::ErrorCode;
using bflow::outline::TaskState;

class ConfigTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    config_path_ = temp_dir_ / "config.toml";
  }

  void writeConfig(const std::string& content) {
    std::ofstream file(config_path_);
    file << content;
  }

  std::filesystem::path config_path_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.todo_heading, "## Todo");
  EXPECT_EQ(config.log_heading, "## Log");
  EXPECT_EQ(config.indent_width, 2);
  EXPECT_TRUE(config.reopen_scheduled);
  EXPECT_EQ(config.logging.level, "warn");
  EXPECT_OK(config.validate());

  auto options = config.moveOptions();
  EXPECT_EQ(options.trigger_states,
            (std::vector<TaskState>{TaskState::kCompleted, TaskState::kStarted}));
  EXPECT_TRUE(options.reopen_scheduled);
  EXPECT_EQ(options.indent_width, 2);
}

TEST_F(ConfigTest, LoadFromFile) {
  writeConfig(R"(
todo_heading = "### Inbox"
log_heading = "### Done"
indent_width = 4
trigger_states = ["completed"]
reopen_scheduled = false

[logging]
level = "debug"
file = true
)");

  Config config;
  ASSERT_OK(config.load(config_path_));
  EXPECT_EQ(config.todo_heading, "### Inbox");
  EXPECT_EQ(config.log_heading, "### Done");
  EXPECT_EQ(config.indent_width, 4);
  EXPECT_EQ(config.trigger_states, std::vector<std::string>{"completed"});
  EXPECT_FALSE(config.reopen_scheduled);
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_TRUE(config.logging.file);
  EXPECT_EQ(config.path(), config_path_);

  auto options = config.moveOptions();
  EXPECT_EQ(options.trigger_states, std::vector<TaskState>{TaskState::kCompleted});
  EXPECT_EQ(options.indent_width, 4);

  auto logging = config.loggingOptions();
  EXPECT_EQ(logging.level, "debug");
  EXPECT_TRUE(logging.file);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  writeConfig("log_heading = \"## Archive\"\n");
  Config config;
  ASSERT_OK(config.load(config_path_));
  EXPECT_EQ(config.log_heading, "## Archive");
  EXPECT_EQ(config.todo_heading, "## Todo");
  EXPECT_EQ(config.indent_width, 2);
}

TEST_F(ConfigTest, LoadErrors) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "missing.toml"), ErrorCode::kConfigError);

  writeConfig("todo_heading = \n[[broken");
  EXPECT_ERROR(config.load(config_path_), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, SaveAndReload) {
  Config config;
  config.log_heading = "## Done";
  config.trigger_states = {"completed", "migrated"};
  config.logging.file_path = "/tmp/bflow.log";
  ASSERT_OK(config.save(config_path_));

  Config reloaded;
  ASSERT_OK(reloaded.load(config_path_));
  EXPECT_EQ(reloaded.log_heading, "## Done");
  EXPECT_EQ(reloaded.trigger_states, config.trigger_states);
  EXPECT_EQ(reloaded.logging.file_path, "/tmp/bflow.log");
  EXPECT_EQ(reloaded.list(), config.list());
}

TEST_F(ConfigTest, GetAndSet) {
  Config config;
  ASSERT_OK(config.set("indent_width", "4"));
  ASSERT_OK(config.set("trigger_states", "completed, started ,meeting"));
  ASSERT_OK(config.set("reopen_scheduled", "no"));
  ASSERT_OK(config.set("logging.level", "info"));

  auto width = config.get("indent_width");
  ASSERT_OK(width);
  EXPECT_EQ(*width, "4");

  auto states = config.get("trigger_states");
  ASSERT_OK(states);
  EXPECT_EQ(*states, "completed,started,meeting");

  auto reopen = config.get("reopen_scheduled");
  ASSERT_OK(reopen);
  EXPECT_EQ(*reopen, "false");

  auto level = config.get("logging.level");
  ASSERT_OK(level);
  EXPECT_EQ(*level, "info");
}

TEST_F(ConfigTest, SetRejectsBadValues) {
  Config config;
  EXPECT_ERROR(config.set("indent_width", "wide"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("reopen_scheduled", "maybe"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("no_such_key", "1"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.get("logging.color"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.get(""), ErrorCode::kConfigError);
  EXPECT_EQ(config.indent_width, 2);
}

TEST_F(ConfigTest, Validate) {
  Config same;
  same.log_heading = "Todo";
  EXPECT_ERROR(same.validate(), ErrorCode::kConfigError);

  Config untitled;
  untitled.todo_heading = "##";
  EXPECT_ERROR(untitled.validate(), ErrorCode::kConfigError);

  Config width;
  width.indent_width = 0;
  EXPECT_ERROR(width.validate(), ErrorCode::kConfigError);

  Config states;
  states.trigger_states = {"completed", "finished"};
  EXPECT_ERROR(states.validate(), ErrorCode::kConfigError);

  Config no_states;
  no_states.trigger_states.clear();
  EXPECT_ERROR(no_states.validate(), ErrorCode::kConfigError);

  Config level;
  level.logging.level = "loud";
  EXPECT_ERROR(level.validate(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaultPath) {
  setenv("BFLOW_CONFIG", config_path_.c_str(), 1);
  EXPECT_EQ(Config::defaultConfigPath(), config_path_);
  unsetenv("BFLOW_CONFIG");
}

TEST_F(ConfigTest, LoadEffective) {
  // Explicit path must exist
  EXPECT_ERROR(Config::loadEffective(temp_dir_ / "missing.toml"), ErrorCode::kConfigError);

  // Missing default file means built-in defaults
  setenv("BFLOW_CONFIG", (temp_dir_ / "absent.toml").c_str(), 1);
  auto defaults = Config::loadEffective();
  ASSERT_OK(defaults);
  EXPECT_EQ(defaults->log_heading, "## Log");

  writeConfig("indent_width = 3\n");
  setenv("BFLOW_CONFIG", config_path_.c_str(), 1);
  auto loaded = Config::loadEffective();
  ASSERT_OK(loaded);
  EXPECT_EQ(loaded->indent_width, 3);

  // Loaded values are validated
  writeConfig("indent_width = 99\n");
  EXPECT_ERROR(Config::loadEffective(config_path_), ErrorCode::kConfigError);
  unsetenv("BFLOW_CONFIG");
}
