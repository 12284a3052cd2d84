#include "bflow/cli/commands/classify_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/outline/document.hpp"
#include "bflow/outline/line_classifier.hpp"
#include "bflow/util/filesystem.hpp"
#include "bflow/util/wikilinks.hpp"

namespace bflow::cli {

namespace {

std::string_view kindToString(outline::LineKind kind) {
  switch (kind) {
    case outline::LineKind::kBlank: return "blank";
    case outline::LineKind::kPlain: return "plain";
    case outline::LineKind::kHeading: return "heading";
    case outline::LineKind::kListItem: return "item";
  }
  return "plain";
}

nlohmann::json lineToJson(int line, const outline::LineInfo& info) {
  nlohmann::json entry;
  entry["line"] = line + 1;
  entry["kind"] = std::string(kindToString(info.kind));
  entry["column"] = info.column;
  entry["depth"] = info.depth;
  if (info.isHeading()) {
    entry["level"] = info.heading_level;
  }
  if (info.isTask()) {
    entry["state"] = std::string(outline::taskStateToString(info.marker->state));
    entry["marker"] = std::string(1, info.marker->symbol);
  }
  entry["content"] = info.content;
  if (auto links = util::findWikilinkMatches(info.content); !links.empty()) {
    nlohmann::json targets = nlohmann::json::array();
    for (const auto& link : links) {
      targets.push_back(util::parseWikilinkText(link.inner).link_path);
    }
    entry["links"] = targets;
    entry["display"] = util::stripWikilinksToDisplayText(info.content);
  }
  return entry;
}

}  // namespace

ClassifyCommand::ClassifyCommand(Application& app) : app_(app) {}

void ClassifyCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "Outline note to inspect")->required();
  cmd->add_option("-l,--line", line_, "Only this line (1-based)")->check(CLI::PositiveNumber);
  cmd->add_flag("--plain", plain_, "Show wikilinks as their display text");
}

Result<int> ClassifyCommand::execute(const GlobalOptions& options) {
  auto content = util::FileSystem::readFile(file_);
  if (!content.has_value()) {
    return CommandErrorHandler(options).handleFileError(content.error(), file_, "read_note");
  }

  outline::Document doc{*content};
  const int count = static_cast<int>(doc.lineCount());
  int first = 0;
  int last = count;
  if (line_ > 0) {
    if (line_ > count) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Line " + std::to_string(line_) + " is past the end of " + file_));
    }
    first = line_ - 1;
    last = line_;
  }

  const int width = app_.config().indent_width;

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (int i = first; i < last; ++i) {
      output.push_back(lineToJson(i, outline::classifyLine(doc.lines()[i], width)));
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  for (int i = first; i < last; ++i) {
    auto info = outline::classifyLine(doc.lines()[i], width);
    std::cout << std::setw(5) << i + 1 << "  " << std::left << std::setw(8) << kindToString(info.kind)
              << std::right << "d" << info.depth;
    if (info.isHeading()) {
      std::cout << "  h" << info.heading_level;
    }
    if (info.isTask()) {
      std::cout << "  [" << info.marker->symbol << "] " << outline::taskStateToString(info.marker->state);
    }
    if (!info.content.empty()) {
      std::cout << "  " << (plain_ ? util::stripWikilinksToDisplayText(info.content) : info.content);
    }
    std::cout << "\n";
  }
  std::cout.flush();

  return 0;
}

}  // namespace bflow::cli
