#include "bflow/move/transfer.hpp"

#include <algorithm>
#include <cstddef>

#include "bflow/outline/document.hpp"
#include "bflow/outline/insertion_point.hpp"
#include "bflow/outline/section_locator.hpp"
#include "bflow/util/wikilinks.hpp"

namespace bflow::move {

namespace {

std::string trimmed(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return std::string(text);
}

std::string lineNumber(int line) {
  return std::to_string(line + 1);
}

// Heading line of heading_text in lines, appending the heading when it is missing
int ensureHeading(std::vector<std::string>& lines, std::string_view heading_text) {
  if (auto section = outline::findSection(lines, heading_text)) {
    return section->heading_line;
  }

  // The final newline stays at the end of the document
  std::size_t at = lines.size();
  if (!lines.empty() && lines.back().empty()) {
    --at;
  }
  std::vector<std::string> added;
  if (at > 0 && !outline::isBlank(lines[at - 1])) {
    added.emplace_back();
  }
  added.push_back(outline::parseTargetHeading(heading_text).toString());
  lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at), added.begin(), added.end());
  return static_cast<int>(at + added.size()) - 1;
}

}  // namespace

Result<Extraction> extractChildren(std::string_view source_text, int parent_line,
                                   std::string_view source_name, std::string_view target_text,
                                   std::string_view log_heading, int indent_width) {
  auto lines = outline::splitLines(source_text);
  const int count = static_cast<int>(lines.size());
  if (parent_line < 0 || parent_line >= count) {
    return makeErrorResult<Extraction>(ErrorCode::kInvalidArgument,
                                       "Line " + lineNumber(parent_line) + " is out of range");
  }

  const std::string parent = lines[parent_line];
  if (!outline::classifyLine(parent, indent_width).isListItem()) {
    return makeErrorResult<Extraction>(ErrorCode::kValidationError,
                                       "Line " + lineNumber(parent_line) + " is not a list item");
  }

  auto matches = util::findWikilinkMatches(parent);
  if (matches.empty()) {
    return makeErrorResult<Extraction>(ErrorCode::kValidationError,
                                       "No wikilink on line " + lineNumber(parent_line));
  }
  const auto& link = matches.front();
  auto parsed = util::parseWikilinkText(link.inner);

  auto block = outline::collectBlock(lines, parent_line, count, indent_width);
  if (block.size() <= 1) {
    return makeErrorResult<Extraction>(ErrorCode::kValidationError,
                                       "Nothing below line " + lineNumber(parent_line) + " to extract");
  }

  Extraction result;
  result.link_path = parsed.link_path;
  result.children = outline::BlockRange{parent_line + 1, block.end_line};
  result.heading = "### [[" + std::string(source_name) + "]]";

  std::vector<std::string> children(lines.begin() + result.children.start_line,
                                    lines.begin() + result.children.end_line);
  result.extracted_lines.push_back(result.heading);
  for (auto& line : outline::dedentLines(children)) {
    result.extracted_lines.push_back(std::move(line));
  }
  result.extracted_lines.emplace_back();

  // The link keeps the text a reader saw and now points at the new heading
  std::string anchor = trimmed(util::stripWikilinksToDisplayText(source_name));
  std::string retargeted = "[[" + parsed.link_path + "#" + anchor + "|" +
                           util::stripWikilinksToDisplayText(link.match_text) + "]]";
  lines[parent_line] = parent.substr(0, link.index) + retargeted +
                       parent.substr(link.index + link.match_text.size());
  lines.erase(lines.begin() + result.children.start_line, lines.begin() + result.children.end_line);
  result.source_text = outline::joinLines(lines, 0, lines.size());

  auto target = outline::splitLines(target_text);
  int heading_line = ensureHeading(target, log_heading);
  target.insert(target.begin() + heading_line + 1, result.extracted_lines.begin(),
                result.extracted_lines.end());
  result.target_text = outline::joinLines(target, 0, target.size());

  return result;
}

Result<Migration> migrateTasks(std::string_view source_text, std::vector<int> task_lines,
                               std::string_view target_text, std::string_view target_heading,
                               int indent_width) {
  auto lines = outline::splitLines(source_text);
  const int count = static_cast<int>(lines.size());

  std::sort(task_lines.begin(), task_lines.end());
  task_lines.erase(std::unique(task_lines.begin(), task_lines.end()), task_lines.end());
  if (task_lines.empty()) {
    return makeErrorResult<Migration>(ErrorCode::kInvalidArgument, "No task lines given");
  }

  std::vector<outline::BlockRange> blocks;
  for (int line : task_lines) {
    if (line < 0 || line >= count) {
      return makeErrorResult<Migration>(ErrorCode::kInvalidArgument,
                                        "Line " + lineNumber(line) + " is out of range");
    }
    auto info = outline::classifyLine(lines[line], indent_width);
    if (!info.hasState(outline::TaskState::kOpen) && !info.hasState(outline::TaskState::kStarted)) {
      return makeErrorResult<Migration>(
          ErrorCode::kValidationError,
          "Line " + lineNumber(line) + " is not an open or started task");
    }
    blocks.push_back(outline::collectBlock(lines, line, count, indent_width));
  }

  for (std::size_t i = 1; i < task_lines.size(); ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      if (blocks[j].contains(task_lines[i])) {
        return makeErrorResult<Migration>(ErrorCode::kValidationError,
                                          "Line " + lineNumber(task_lines[i]) +
                                              " is part of the task on line " +
                                              lineNumber(task_lines[j]));
      }
    }
  }

  Migration result;
  result.task_lines = task_lines;

  // Bottom to top, so removing children keeps the earlier line numbers valid
  std::vector<std::vector<std::string>> collected(task_lines.size());
  result.titles.resize(task_lines.size());
  for (std::size_t k = task_lines.size(); k-- > 0;) {
    const int line = task_lines[k];
    const auto& block = blocks[k];
    const std::string task = lines[line];
    const std::size_t indent = outline::countIndent(task);
    result.titles[k] = outline::stripListPrefix(task);

    auto& content = collected[k];
    content.push_back(outline::withTaskState(task.substr(indent), outline::TaskState::kOpen)
                          .value_or(task.substr(indent)));
    std::vector<std::string> children(lines.begin() + line + 1, lines.begin() + block.end_line);
    for (auto& child : outline::dedentLinesByAmount(children, indent)) {
      content.push_back(std::move(child));
    }

    lines[line] = outline::withTaskState(task, outline::TaskState::kMigrated).value_or(task);
    lines.erase(lines.begin() + line + 1, lines.begin() + block.end_line);
  }

  result.source_text = outline::joinLines(lines, 0, lines.size());

  std::vector<std::string> inserted;
  for (auto& content : collected) {
    inserted.insert(inserted.end(), content.begin(), content.end());
  }

  auto target = outline::splitLines(target_text);
  int heading_line = ensureHeading(target, target_heading);
  int section_end = outline::findSectionEnd(target, heading_line);
  int insertion = outline::findInsertionLine(target, heading_line, section_end);
  target.insert(target.begin() + insertion, inserted.begin(), inserted.end());
  result.target_text = outline::joinLines(target, 0, target.size());

  return result;
}

}  // namespace bflow::move
