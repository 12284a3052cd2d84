#include "bflow/outline/line_classifier.hpp"

#include <algorithm>

namespace bflow::outline {

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t';
}

bool isBulletChar(char c) {
  return c == '-' || c == '*' || c == '+';
}

std::size_t skipSpaces(std::string_view text, std::size_t pos) {
  while (pos < text.size() && isSpace(text[pos])) {
    ++pos;
  }
  return pos;
}

}  // namespace

TaskState taskStateFromChar(char symbol) {
  switch (symbol) {
    case ' ':
      return TaskState::kOpen;
    case 'x':
    case 'X':
      return TaskState::kCompleted;
    case '/':
      return TaskState::kStarted;
    case '<':
      return TaskState::kScheduled;
    case '>':
      return TaskState::kMigrated;
    case 'o':
      return TaskState::kMeeting;
    default:
      return TaskState::kCustom;
  }
}

char taskStateToChar(TaskState state) {
  switch (state) {
    case TaskState::kOpen:
      return ' ';
    case TaskState::kCompleted:
      return 'x';
    case TaskState::kStarted:
      return '/';
    case TaskState::kScheduled:
      return '<';
    case TaskState::kMigrated:
      return '>';
    case TaskState::kMeeting:
      return 'o';
    case TaskState::kCustom:
      return '?';
  }
  return '?';
}

std::string_view taskStateToString(TaskState state) {
  switch (state) {
    case TaskState::kOpen:
      return "open";
    case TaskState::kCompleted:
      return "completed";
    case TaskState::kStarted:
      return "started";
    case TaskState::kScheduled:
      return "scheduled";
    case TaskState::kMigrated:
      return "migrated";
    case TaskState::kMeeting:
      return "meeting";
    case TaskState::kCustom:
      return "custom";
  }
  return "custom";
}

std::optional<TaskState> taskStateFromString(std::string_view name) {
  static constexpr TaskState kAll[] = {
    TaskState::kOpen, TaskState::kCompleted, TaskState::kStarted, TaskState::kScheduled,
    TaskState::kMigrated, TaskState::kMeeting, TaskState::kCustom
  };
  for (auto state : kAll) {
    if (taskStateToString(state) == name) {
      return state;
    }
  }
  return std::nullopt;
}

std::size_t countIndent(std::string_view line) {
  std::size_t i = 0;
  while (i < line.size() && isSpace(line[i])) {
    ++i;
  }
  return i;
}

int indentDepth(std::string_view line, int indent_width) {
  if (indent_width <= 0) {
    indent_width = 1;
  }

  int depth = 0;
  int spaces = 0;
  for (char c : line) {
    if (c == ' ') {
      ++spaces;
    } else if (c == '\t') {
      depth += (spaces + indent_width - 1) / indent_width;
      spaces = 0;
      ++depth;
    } else {
      break;
    }
  }
  depth += (spaces + indent_width - 1) / indent_width;
  return depth;
}

int indentColumns(std::string_view line, int indent_width) {
  if (indent_width <= 0) {
    indent_width = 1;
  }

  int columns = 0;
  for (char c : line) {
    if (c == ' ') {
      ++columns;
    } else if (c == '\t') {
      columns += indent_width;
    } else {
      break;
    }
  }
  return columns;
}

bool isBlank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](char c) {
    return isSpace(c) || c == '\r';
  });
}

int headingLevel(std::string_view line) {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > 6) {
    return 0;
  }
  if (hashes < line.size() && !isSpace(line[hashes])) {
    return 0;
  }
  return static_cast<int>(hashes);
}

std::optional<TaskMarker> parseTaskMarker(std::string_view line) {
  std::size_t pos = countIndent(line);
  if (pos >= line.size() || !isBulletChar(line[pos])) {
    return std::nullopt;
  }
  ++pos;
  if (pos >= line.size() || !isSpace(line[pos])) {
    return std::nullopt;
  }
  pos = skipSpaces(line, pos);

  // Need "[c]" followed by whitespace or end of line
  if (pos + 2 >= line.size() || line[pos] != '[' || line[pos + 2] != ']') {
    return std::nullopt;
  }
  char symbol = line[pos + 1];
  if (symbol == '[' || symbol == ']') {
    return std::nullopt;
  }
  std::size_t after = pos + 3;
  if (after < line.size() && !isSpace(line[after]) && line[after] != '\r') {
    return std::nullopt;
  }

  TaskMarker marker;
  marker.state = taskStateFromChar(symbol);
  marker.symbol = symbol;
  marker.column = pos;
  return marker;
}

LineInfo classifyLine(std::string_view line, int indent_width) {
  LineInfo info;
  info.indent = countIndent(line);
  info.column = indentColumns(line, indent_width);
  info.depth = indentDepth(line, indent_width);

  if (isBlank(line)) {
    info.kind = LineKind::kBlank;
    return info;
  }

  if (int level = headingLevel(line); level > 0) {
    info.kind = LineKind::kHeading;
    info.heading_level = level;
    std::size_t start = skipSpaces(line, static_cast<std::size_t>(level));
    info.prefix = std::string(line.substr(0, start));
    std::string_view title = line.substr(start);
    while (!title.empty() && (isSpace(title.back()) || title.back() == '\r')) {
      title.remove_suffix(1);
    }
    info.content = std::string(title);
    return info;
  }

  std::size_t pos = info.indent;
  bool bullet = isBulletChar(line[pos]) &&
                (pos + 1 == line.size() || isSpace(line[pos + 1]));
  if (!bullet) {
    info.kind = LineKind::kPlain;
    info.content = std::string(line.substr(pos));
    return info;
  }

  info.kind = LineKind::kListItem;
  info.bullet = line[pos];
  std::size_t content_start = skipSpaces(line, pos + 1);

  info.marker = parseTaskMarker(line);
  if (info.marker) {
    content_start = skipSpaces(line, info.marker->column + 3);
  }

  info.prefix = std::string(line.substr(pos, content_start - pos));
  info.content = std::string(line.substr(content_start));
  return info;
}

std::optional<std::string> withTaskState(std::string_view line, TaskState state) {
  auto marker = parseTaskMarker(line);
  if (!marker) {
    return std::nullopt;
  }
  std::string rewritten(line);
  rewritten[marker->column + 1] = taskStateToChar(state);
  return rewritten;
}

std::string stripListPrefix(std::string_view line) {
  auto info = classifyLine(line);
  if (info.isListItem()) {
    return info.content;
  }
  return std::string(line.substr(info.indent));
}

std::vector<std::string> dedentLines(const std::vector<std::string>& lines) {
  std::optional<std::size_t> min_indent;
  for (const auto& line : lines) {
    if (isBlank(line)) continue;
    auto indent = countIndent(line);
    if (!min_indent || indent < *min_indent) {
      min_indent = indent;
    }
  }

  if (!min_indent || *min_indent == 0) {
    return lines;
  }

  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (isBlank(line)) {
      out.emplace_back();
    } else {
      out.push_back(line.substr(*min_indent));
    }
  }
  return out;
}

std::vector<std::string> dedentLinesByAmount(const std::vector<std::string>& lines,
                                             std::size_t amount) {
  if (amount == 0) {
    return lines;
  }

  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (isBlank(line)) {
      out.emplace_back();
      continue;
    }
    out.push_back(line.substr(std::min(countIndent(line), amount)));
  }
  return out;
}

}  // namespace bflow::outline
