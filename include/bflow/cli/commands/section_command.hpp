#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

// Shows where a section starts and ends and where moved content would land
class SectionCommand : public Command {
 public:
  explicit SectionCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "section"; }
  std::string description() const override { return "Show a section's range and insertion point"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  std::string heading_;
};

}  // namespace bflow::cli
