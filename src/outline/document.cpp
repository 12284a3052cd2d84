#include "bflow/outline/document.hpp"

#include <algorithm>

namespace bflow::outline {

std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

std::string joinLines(const std::vector<std::string>& lines, std::size_t begin, std::size_t end) {
  end = std::min(end, lines.size());
  std::string out;
  for (std::size_t i = begin; i < end; ++i) {
    if (i > begin) {
      out += '\n';
    }
    out += lines[i];
  }
  return out;
}

Document::Document(std::string text)
    : text_(std::move(text)), lines_(splitLines(text_)) {
  offsets_.reserve(lines_.size());
  std::size_t offset = 0;
  for (const auto& line : lines_) {
    offsets_.push_back(offset);
    offset += line.size() + 1;
  }
}

std::size_t Document::lineOffset(std::size_t line) const {
  if (line >= offsets_.size()) {
    return text_.size();
  }
  return offsets_[line];
}

std::size_t Document::lineAt(std::size_t offset) const {
  auto it = std::upper_bound(offsets_.begin(), offsets_.end(), offset);
  if (it == offsets_.begin()) {
    return 0;
  }
  return static_cast<std::size_t>(std::distance(offsets_.begin(), it)) - 1;
}

bool Document::endsWithNewline() const {
  return !text_.empty() && text_.back() == '\n';
}

Result<std::string> applyEdits(std::string_view text, std::vector<TextEdit> edits) {
  std::stable_sort(edits.begin(), edits.end(), [](const TextEdit& a, const TextEdit& b) {
    if (a.from != b.from) {
      return a.from < b.from;
    }
    return a.isInsertion() && !b.isInsertion();
  });

  for (std::size_t i = 0; i < edits.size(); ++i) {
    const auto& edit = edits[i];
    if (edit.from > edit.to || edit.to > text.size()) {
      return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                          "Edit range out of bounds: [" +
                                          std::to_string(edit.from) + ", " +
                                          std::to_string(edit.to) + ")");
    }
    if (i + 1 < edits.size() && edit.to > edits[i + 1].from) {
      return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                          "Overlapping edits at offset " +
                                          std::to_string(edits[i + 1].from));
    }
  }

  std::string result(text);
  for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
    result.replace(it->from, it->to - it->from, it->insert);
  }
  return result;
}

}  // namespace bflow::outline
