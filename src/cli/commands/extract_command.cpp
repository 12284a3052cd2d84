#include "bflow/cli/commands/extract_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/move/transfer.hpp"
#include "bflow/outline/document.hpp"
#include "bflow/util/filesystem.hpp"
#include "bflow/util/wikilinks.hpp"

namespace bflow::cli {

ExtractCommand::ExtractCommand(Application& app) : app_(app) {}

void ExtractCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note holding the item")->required();
  cmd->add_option("-l,--line", line_, "Line of the linked item (1-based)")->required()->check(CLI::PositiveNumber);
  cmd->add_option("--to", target_, "Note to file the lines in (default: <link>.md beside the file)");
  cmd->add_option("--heading", heading_, "Target section heading (default: log_heading)");
  cmd->add_flag("--dry-run", dry_run_, "Show the extraction without writing either file");
}

Result<int> ExtractCommand::execute(const GlobalOptions& options) {
  auto& config = app_.config();
  std::string heading = heading_.empty() ? config.log_heading : heading_;
  CommandErrorHandler handler(options);

  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return handler.handleFileError(content.error(), file_, "read_note");
  }

  const int line = line_ - 1;
  std::filesystem::path source_path(file_);
  std::filesystem::path target_path(target_);
  if (target_.empty()) {
    auto lines = outline::splitLines(*content);
    if (line >= static_cast<int>(lines.size())) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Line " + std::to_string(line_) + " is past the end of " + file_));
    }
    auto matches = util::findWikilinkMatches(lines[line]);
    if (matches.empty()) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "No wikilink on line " + std::to_string(line_) +
                                           "; pass --to to name the target note"));
    }
    auto link = util::parseWikilinkText(matches.front().inner).link_path;
    target_path = source_path.parent_path() / (link + ".md");
  }

  std::error_code ec;
  if (std::filesystem::equivalent(source_path, target_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Cannot extract into the same note: " + target_path.string()));
  }

  auto target_content = util::FileSystem::readFile(target_path);
  if (!target_content.has_value()) {
    return handler.handleFileError(target_content.error(), target_path.string(), "read_target");
  }

  auto extraction = move::extractChildren(*content, line, source_path.stem().string(), *target_content,
                                          heading, config.indent_width);
  if (!extraction.has_value()) {
    return std::unexpected(extraction.error());
  }

  if (!dry_run_) {
    // Target first; a failed source write leaves the lines in both notes
    auto target_write = util::FileSystem::writeFileAtomic(target_path, extraction->target_text);
    if (!target_write.has_value()) {
      return handler.handleFileError(target_write.error(), target_path.string(), "write_target");
    }
    auto source_write = util::FileSystem::writeFileAtomic(file_, extraction->source_text);
    if (!source_write.has_value()) {
      return handler.handleFileError(source_write.error(), file_, "write_note");
    }
    spdlog::info("extract: {} lines {}-{} filed in {}", file_, extraction->children.start_line + 1,
                 extraction->children.end_line, target_path.string());
  }

  if (options.json) {
    nlohmann::json output;
    output["extracted"] = extraction->children.size();
    output["dry_run"] = dry_run_;
    output["target"] = target_path.string();
    output["link"] = extraction->link_path;
    output["heading"] = extraction->heading;
    output["children"] = {{"start", extraction->children.start_line + 1},
                          {"end", extraction->children.end_line}};
    if (dry_run_) {
      output["result"] = {{"source", extraction->source_text}, {"target", extraction->target_text}};
    }
    std::cout << output.dump(2) << std::endl;
  } else if (dry_run_) {
    std::cout << outline::joinLines(extraction->extracted_lines, 0, extraction->extracted_lines.size());
  } else if (!options.quiet) {
    std::cout << "Extracted lines " << extraction->children.start_line + 1 << "-"
              << extraction->children.end_line << " to " << target_path.string() << std::endl;
  }

  return 0;
}

}  // namespace bflow::cli
