#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

// Moves every finished task block of the todo section to the log section
class SweepCommand : public Command {
 public:
  explicit SweepCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "sweep"; }
  std::string description() const override { return "Move all finished task blocks to the log section"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  std::string from_;
  std::string to_;
  bool dry_run_ = false;
};

}  // namespace bflow::cli
