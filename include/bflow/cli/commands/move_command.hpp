#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

/**
 * Moves the task block around one line from the todo section to the log section
 *
 * Without --strict a task that cannot move (wrong state, outside the section)
 * is reported and the command still succeeds.
 */
class MoveCommand : public Command {
 public:
  explicit MoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "move"; }
  std::string description() const override { return "Move a finished task block to the log section"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  int line_ = 0;
  std::string from_;
  std::string to_;
  bool dry_run_ = false;
  bool strict_ = false;
};

}  // namespace bflow::cli
