// include/UAC/LineTokenizer.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace UAC {

/**
 * @brief One non-blank line of an lsusb dump.
 */
struct DescriptorLine {
    size_t indent = 0;       ///< Count of leading whitespace characters
    std::string content;     ///< Line text with surrounding whitespace removed
    size_t lineNumber = 0;   ///< 1-based position in the source text
};

/**
 * @brief Split raw dump text into indented lines.
 *
 * Blank and whitespace-only lines are dropped. Spaces and tabs each count
 * as one indentation step.
 */
std::vector<DescriptorLine> tokenizeLines(std::string_view text);

/**
 * @brief Sequential reader over tokenized lines with lookahead.
 */
class LineCursor {
public:
    explicit LineCursor(std::vector<DescriptorLine> lines);

    bool atEnd() const { return position_ >= lines_.size(); }
    const DescriptorLine& current() const { return lines_[position_]; }
    void advance() { if (!atEnd()) ++position_; }
    size_t position() const { return position_; }
    size_t size() const { return lines_.size(); }

    /**
     * @brief Line at current position + offset, or nullptr past the end.
     */
    const DescriptorLine* peek(size_t offset = 0) const;

    /**
     * @brief True if the current line belongs to a section whose header sits at headerIndent.
     */
    bool inBody(size_t headerIndent) const {
        return !atEnd() && current().indent > headerIndent;
    }

    /**
     * @brief Scan the body starting at the current position without consuming it.
     *
     * Stops at the first line indented at or below headerIndent.
     * @return The first body line whose content starts with prefix, or nullptr.
     */
    const DescriptorLine* findInBody(size_t headerIndent, std::string_view prefix) const;

    /**
     * @brief Consume and discard the remainder of a section body.
     * @return Number of lines skipped.
     */
    size_t skipBody(size_t headerIndent);

private:
    std::vector<DescriptorLine> lines_;
    size_t position_ = 0;
};

} // namespace UAC
