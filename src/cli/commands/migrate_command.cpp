#include "bflow/cli/commands/migrate_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/move/transfer.hpp"
#include "bflow/util/filesystem.hpp"

namespace bflow::cli {

MigrateCommand::MigrateCommand(Application& app) : app_(app) {}

void MigrateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note holding the tasks")->required();
  cmd->add_option("-l,--line", lines_, "Line of a task to migrate (1-based, repeatable)")
      ->required()
      ->check(CLI::PositiveNumber);
  cmd->add_option("--to", target_, "Existing note that receives the tasks")->required();
  cmd->add_option("--heading", heading_, "Target section heading (default: todo_heading)");
  cmd->add_flag("--dry-run", dry_run_, "Show the result without writing either file");
}

Result<int> MigrateCommand::execute(const GlobalOptions& options) {
  auto& config = app_.config();
  std::string heading = heading_.empty() ? config.todo_heading : heading_;
  CommandErrorHandler handler(options);

  std::error_code ec;
  if (std::filesystem::equivalent(file_, target_, ec)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Cannot migrate into the same note: " + target_));
  }

  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return handler.handleFileError(content.error(), file_, "read_note");
  }
  auto target_content = util::FileSystem::readFile(target_);
  if (!target_content.has_value()) {
    return handler.handleFileError(target_content.error(), target_, "read_target");
  }

  std::vector<int> task_lines;
  for (int line : lines_) {
    task_lines.push_back(line - 1);
  }

  auto migration = move::migrateTasks(*content, task_lines, *target_content, heading,
                                      config.indent_width);
  if (!migration.has_value()) {
    return std::unexpected(migration.error());
  }

  if (!dry_run_) {
    auto target_write = util::FileSystem::writeFileAtomic(target_, migration->target_text);
    if (!target_write.has_value()) {
      return handler.handleFileError(target_write.error(), target_, "write_target");
    }
    auto source_write = util::FileSystem::writeFileAtomic(file_, migration->source_text);
    if (!source_write.has_value()) {
      return handler.handleFileError(source_write.error(), file_, "write_note");
    }
    spdlog::info("migrate: {} task(s) from {} to {}", migration->task_lines.size(), file_, target_);
  }

  if (options.json) {
    nlohmann::json output;
    output["migrated"] = migration->task_lines.size();
    output["dry_run"] = dry_run_;
    output["target"] = target_;
    nlohmann::json tasks = nlohmann::json::array();
    for (std::size_t i = 0; i < migration->task_lines.size(); ++i) {
      tasks.push_back({{"line", migration->task_lines[i] + 1}, {"title", migration->titles[i]}});
    }
    output["tasks"] = tasks;
    if (dry_run_) {
      output["result"] = {{"source", migration->source_text}, {"target", migration->target_text}};
    }
    std::cout << output.dump(2) << std::endl;
  } else if (dry_run_) {
    std::cout << migration->target_text;
    if (!migration->target_text.empty() && migration->target_text.back() != '\n') {
      std::cout << std::endl;
    }
  } else if (!options.quiet) {
    std::cout << "Migrated " << migration->task_lines.size() << " task(s) to " << target_ << std::endl;
    for (const auto& title : migration->titles) {
      std::cout << "  > " << title << std::endl;
    }
  }

  return 0;
}

}  // namespace bflow::cli
