#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "bflow/common.hpp"
#include "bflow/move/move_planner.hpp"
#include "bflow/util/logging.hpp"

namespace bflow::config {

// Configuration for the bflow tool
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config() = default;

  // Headings of the managed sections, with their '#' markers
  std::string todo_heading = "## Todo";
  std::string log_heading = "## Log";

  // Spaces per indentation level
  int indent_width = outline::kDefaultIndentWidth;

  // Task states that trigger a move ("completed", "started", ...)
  std::vector<std::string> trigger_states = {"completed", "started"};

  // Rewrite scheduled markers to open when a block moves
  bool reopen_scheduled = true;

  struct LoggingConfig {
    std::string level = "warn";
    bool file = false;
    std::string file_path;  // empty: $XDG_DATA_HOME/bflow/logs/bflow.log
  };
  LoggingConfig logging;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation ("logging.level")
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Every key with its current value, in file order
  std::vector<std::pair<std::string, std::string>> list() const;

  // Validate configuration
  Result<void> validate() const;

  // Options for the move planner derived from this configuration
  move::MoveOptions moveOptions() const;

  util::LoggingOptions loggingOptions() const;

  const std::filesystem::path& path() const { return config_path_; }

  // $BFLOW_CONFIG if set, otherwise $XDG_CONFIG_HOME/bflow/config.toml
  static std::filesystem::path defaultConfigPath();

  // Create default configuration
  static Config createDefault();

  /**
   * @brief Load the configuration a command should run with
   *
   * An explicit path must exist. Without one the default path is used when the
   * file exists, and built-in defaults otherwise.
   */
  static Result<Config> loadEffective(const std::filesystem::path& explicit_path = {});

 private:
  std::filesystem::path config_path_;

  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace bflow::config
