#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

// Prints how each line of a note is classified
class ClassifyCommand : public Command {
 public:
  explicit ClassifyCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "classify"; }
  std::string description() const override { return "Show line kinds, depths and task states"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  int line_ = 0;  // 0: all lines
  bool plain_ = false;
};

}  // namespace bflow::cli
