#include "bflow/cli/commands/section_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/outline/document.hpp"
#include "bflow/outline/insertion_point.hpp"
#include "bflow/outline/section_locator.hpp"
#include "bflow/util/filesystem.hpp"

namespace bflow::cli {

SectionCommand::SectionCommand(Application& app) : app_(app) {}

void SectionCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note to inspect")->required();
  cmd->add_option("heading", heading_, "Heading text, e.g. \"## Log\"")->required();
}

Result<int> SectionCommand::execute(const GlobalOptions& options) {
  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return CommandErrorHandler(options).handleFileError(content.error(), file_, "read_note");
  }

  outline::Document doc{*content};
  auto section = outline::findSection(doc.lines(), heading_);
  if (!section) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "Section not found: " + heading_));
  }

  int insertion = outline::findInsertionLine(doc.lines(), section->heading_line, section->end_line);

  if (options.json) {
    nlohmann::json output;
    output["heading"] = heading_;
    output["heading_line"] = section->heading_line + 1;
    output["end_line"] = section->end_line;
    output["insertion_line"] = insertion + 1;
    output["empty"] = section->isEmpty();
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << "Heading:   line " << section->heading_line + 1 << "\n";
    std::cout << "Content:   lines " << section->contentStart() + 1 << "-" << section->end_line << "\n";
    std::cout << "Insert at: line " << insertion + 1 << std::endl;
  }

  return 0;
}

}  // namespace bflow::cli
