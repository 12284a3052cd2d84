#include "bflow/cli/commands/block_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/outline/document.hpp"
#include "bflow/outline/outline_tree.hpp"
#include "bflow/outline/section_locator.hpp"
#include "bflow/util/filesystem.hpp"

namespace bflow::cli {

BlockCommand::BlockCommand(Application& app) : app_(app) {}

void BlockCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note to inspect")->required();
  cmd->add_option("-l,--line", line_, "Line inside the block (1-based)")->required()->check(CLI::PositiveNumber);
  cmd->add_option("-s,--section", section_, "Bound the search to this section (default: enclosing heading)");
}

Result<int> BlockCommand::execute(const GlobalOptions& options) {
  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return CommandErrorHandler(options).handleFileError(content.error(), file_, "read_note");
  }

  outline::Document doc{*content};
  const auto& lines = doc.lines();
  const int line = line_ - 1;
  if (line >= static_cast<int>(doc.lineCount())) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Line " + std::to_string(line_) + " is past the end of " + file_));
  }

  outline::SectionRange section{-1, static_cast<int>(doc.lineCount())};
  if (!section_.empty()) {
    auto found = outline::findSection(lines, section_);
    if (!found) {
      return std::unexpected(makeError(ErrorCode::kNotFound, "Section not found: " + section_));
    }
    section = *found;
  } else if (auto enclosing = outline::findEnclosingSection(lines, line)) {
    section = *enclosing;
  }

  auto block = outline::resolveBlock(lines, line, section, app_.config().indent_width);
  if (!block) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Line " + std::to_string(line_) + " is outside the section"));
  }

  std::string text = outline::joinLines(lines, static_cast<std::size_t>(block->start_line),
                                        static_cast<std::size_t>(block->end_line));

  if (options.json) {
    nlohmann::json output;
    output["start"] = block->start_line + 1;
    output["end"] = block->end_line;
    output["lines"] = block->size();
    output["text"] = text;
    std::cout << output.dump(2) << std::endl;
  } else {
    if (!options.quiet) {
      std::cout << "Lines " << block->start_line + 1 << "-" << block->end_line << ":\n";
    }
    std::cout << text << std::endl;
  }

  return 0;
}

}  // namespace bflow::cli
