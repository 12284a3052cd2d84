#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "bflow/cli/application.hpp"

namespace bflow::cli {

/**
 * Files the nested lines under a linked list item into the linked note
 *
 * The target defaults to the note named by the item's first wikilink, looked
 * up as "<link>.md" beside the source file. The target must already exist.
 */
class ExtractCommand : public Command {
 public:
  explicit ExtractCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "extract"; }
  std::string description() const override { return "Move the lines below a linked item into the linked note"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;
  std::string file_;
  int line_ = 0;
  std::string target_;
  std::string heading_;
  bool dry_run_ = false;
};

}  // namespace bflow::cli
