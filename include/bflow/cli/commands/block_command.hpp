#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

// Shows the block (list item and subtree) that a line belongs to
class BlockCommand : public Command {
 public:
  explicit BlockCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "block"; }
  std::string description() const override { return "Show the block a line belongs to"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  int line_ = 0;
  std::string section_;
};

}  // namespace bflow::cli
