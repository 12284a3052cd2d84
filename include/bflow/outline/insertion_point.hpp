#pragma once

#include <string>
#include <vector>

namespace bflow::outline {

/**
 * @brief Choose the line before which moved content is inserted in a section
 *
 * Content after the first blank line of a section is treated as "upcoming" and
 * stays last, so insertion happens at that blank line. Without a blank line the
 * content goes after the last list item; an empty or list-free section receives
 * it right after the heading.
 *
 * @param lines Document lines
 * @param section_start Heading line of the section
 * @param section_end Exclusive end of the section
 * @return Insertion line in [section_start + 1, section_end], or -1 for an invalid heading line
 */
int findInsertionLine(const std::vector<std::string>& lines, int section_start, int section_end);

}  // namespace bflow::outline
