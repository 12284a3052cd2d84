#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "bflow/common.hpp"

namespace bflow::outline {

/**
 * @brief Replacement of the character range [from, to) with insert
 *
 * Offsets always refer to the snapshot the edit was computed against.
 */
struct TextEdit {
  std::size_t from = 0;
  std::size_t to = 0;
  std::string insert;

  bool isInsertion() const { return from == to; }
  bool operator==(const TextEdit& other) const = default;
};

// Split on '\n'. A trailing newline yields a final empty line; "" yields one empty line.
std::vector<std::string> splitLines(std::string_view text);

// Join lines [begin, end) with '\n', no trailing newline
std::string joinLines(const std::vector<std::string>& lines, std::size_t begin, std::size_t end);

/**
 * @brief Immutable snapshot of a document with its line table
 *
 * Line offsets are computed once from the text and are only valid for this
 * snapshot; a changed document needs a new Document.
 */
class Document {
 public:
  explicit Document(std::string text);

  const std::string& text() const { return text_; }
  const std::vector<std::string>& lines() const { return lines_; }
  std::size_t lineCount() const { return lines_.size(); }
  std::size_t size() const { return text_.size(); }

  // Offset of the first character of line; the document size for line >= lineCount()
  std::size_t lineOffset(std::size_t line) const;

  // Line containing offset (offsets past the end map to the last line)
  std::size_t lineAt(std::size_t offset) const;

  bool endsWithNewline() const;

 private:
  std::string text_;
  std::vector<std::string> lines_;
  std::vector<std::size_t> offsets_;
};

/**
 * @brief Apply an edit script computed against one snapshot
 *
 * Edits are ordered by offset (insertions before deletions that start at the
 * same offset) and applied back to front, so no edit sees shifted offsets.
 * Overlapping or out-of-range edits are rejected as a whole.
 */
Result<std::string> applyEdits(std::string_view text, std::vector<TextEdit> edits);

}  // namespace bflow::outline
