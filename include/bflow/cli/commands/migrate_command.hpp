#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

// Copies open tasks forward into another note and marks them [>] in place
class MigrateCommand : public Command {
 public:
  explicit MigrateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "migrate"; }
  std::string description() const override { return "Carry open tasks forward into another note"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  std::vector<int> lines_;
  std::string target_;
  std::string heading_;
  bool dry_run_ = false;
};

}  // namespace bflow::cli
