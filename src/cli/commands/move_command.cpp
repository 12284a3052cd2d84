#include "bflow/cli/commands/move_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/move/move_planner.hpp"
#include "bflow/util/filesystem.hpp"

namespace bflow::cli {

MoveCommand::MoveCommand(Application& app) : app_(app) {}

void MoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note to edit")->required();
  cmd->add_option("-l,--line", line_, "Line of the task (1-based)")->required()->check(CLI::PositiveNumber);
  cmd->add_option("--from", from_, "Source section heading (default: todo_heading)");
  cmd->add_option("--to", to_, "Destination section heading (default: log_heading)");
  cmd->add_flag("--dry-run", dry_run_, "Print the result instead of writing the file");
  cmd->add_flag("--strict", strict_, "Fail when the task cannot be moved");
}

Result<int> MoveCommand::execute(const GlobalOptions& options) {
  auto& config = app_.config();
  std::string source = from_.empty() ? config.todo_heading : from_;
  std::string dest = to_.empty() ? config.log_heading : to_;

  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return CommandErrorHandler(options).handleFileError(content.error(), file_, "read_note");
  }

  outline::Document doc{*content};
  move::MovePlanner planner(config.moveOptions());
  auto plan = planner.plan(doc, line_ - 1, source, dest);

  if (!plan) {
    auto reason = std::string(move::rejectReasonToString(planner.rejectReason()));
    spdlog::debug("move: {}:{} rejected: {}", file_, line_, reason);
    if (strict_) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "Line " + std::to_string(line_) + " not moved: " + reason));
    }
    if (options.json) {
      nlohmann::json output;
      output["moved"] = false;
      output["reason"] = reason;
      std::cout << output.dump(2) << std::endl;
    } else if (!options.quiet) {
      std::cout << "Nothing to move: " << reason << std::endl;
    }
    return 0;
  }

  auto updated = outline::applyEdits(doc.text(), plan->edits());
  if (!updated.has_value()) {
    return std::unexpected(updated.error());
  }

  if (!dry_run_) {
    auto write_result = util::FileSystem::writeFileAtomic(file_, *updated);
    if (!write_result.has_value()) {
      return CommandErrorHandler(options).handleFileError(write_result.error(), file_, "write_note");
    }
    spdlog::info("move: {} lines {}-{} moved to '{}'", file_, plan->block.start_line + 1,
                 plan->block.end_line, dest);
  }

  if (options.json) {
    nlohmann::json output;
    output["moved"] = true;
    output["dry_run"] = dry_run_;
    output["block"] = {{"start", plan->block.start_line + 1}, {"end", plan->block.end_line}};
    output["delete"] = {{"from", plan->delete_from}, {"to", plan->delete_to}};
    output["insert"] = {{"at", plan->insert_at}, {"text", plan->insert_text}};
    output["created_destination"] = plan->created_destination;
    if (dry_run_) {
      output["result"] = *updated;
    }
    std::cout << output.dump(2) << std::endl;
  } else if (dry_run_) {
    std::cout << *updated;
    if (!updated->empty() && updated->back() != '\n') {
      std::cout << std::endl;
    }
  } else if (!options.quiet) {
    std::cout << "Moved lines " << plan->block.start_line + 1 << "-" << plan->block.end_line
              << " to '" << dest << "'" << std::endl;
  }

  return 0;
}

}  // namespace bflow::cli
