#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value
 * - list: List all configuration
 * - path: Show configuration file path
 * - validate: Validate current configuration
 */
class ConfigCommand : public Command {
 public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }

 private:
  Application& app_;

  bool get_mode_ = false;
  bool set_mode_ = false;
  bool list_mode_ = false;
  bool path_mode_ = false;
  bool validate_mode_ = false;

  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeValidate(const GlobalOptions& options);
};

}  // namespace bflow::cli
