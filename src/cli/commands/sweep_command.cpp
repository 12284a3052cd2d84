#include "bflow/cli/commands/sweep_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/move/move_planner.hpp"
#include "bflow/util/filesystem.hpp"

namespace bflow::cli {

SweepCommand::SweepCommand(Application& app) : app_(app) {}

void SweepCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note to edit")->required();
  cmd->add_option("--from", from_, "Source section heading (default: todo_heading)");
  cmd->add_option("--to", to_, "Destination section heading (default: log_heading)");
  cmd->add_flag("--dry-run", dry_run_, "Print the result instead of writing the file");
}

Result<int> SweepCommand::execute(const GlobalOptions& options) {
  auto& config = app_.config();
  std::string source = from_.empty() ? config.todo_heading : from_;
  std::string dest = to_.empty() ? config.log_heading : to_;

  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return CommandErrorHandler(options).handleFileError(content.error(), file_, "read_note");
  }

  auto result = move::sweepCompleted(*content, source, dest, config.moveOptions());

  if (result.text && !dry_run_) {
    auto write_result = util::FileSystem::writeFileAtomic(file_, *result.text);
    if (!write_result.has_value()) {
      return CommandErrorHandler(options).handleFileError(write_result.error(), file_, "write_note");
    }
    spdlog::info("sweep: {} moved {} block(s) to '{}'", file_, result.moved, dest);
  }

  if (options.json) {
    nlohmann::json output;
    output["moved"] = result.moved;
    output["dry_run"] = dry_run_;
    if (dry_run_) {
      output["result"] = result.text.value_or(*content);
    }
    std::cout << output.dump(2) << std::endl;
  } else if (dry_run_) {
    const std::string& text = result.text ? *result.text : *content;
    std::cout << text;
    if (!text.empty() && text.back() != '\n') {
      std::cout << std::endl;
    }
  } else if (!options.quiet) {
    if (result.moved == 0) {
      std::cout << "Nothing to move" << std::endl;
    } else {
      std::cout << "Moved " << result.moved << " block(s) to '" << dest << "'" << std::endl;
    }
  }

  return 0;
}

}  // namespace bflow::cli
