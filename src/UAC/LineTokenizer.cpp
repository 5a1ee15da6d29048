// LineTokenizer.cpp
#include "UAC/LineTokenizer.hpp"
#include <utility>

namespace UAC {

namespace {

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

std::vector<DescriptorLine> tokenizeLines(std::string_view text) {
    std::vector<DescriptorLine> lines;
    size_t lineNumber = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view raw = text.substr(start, end - start);
        ++lineNumber;

        size_t indent = 0;
        while (indent < raw.size() && isBlank(raw[indent])) ++indent;
        size_t last = raw.size();
        while (last > indent && isBlank(raw[last - 1])) --last;

        if (last > indent) {
            lines.push_back(DescriptorLine{indent, std::string(raw.substr(indent, last - indent)), lineNumber});
        }
        if (end == text.size()) break;
        start = end + 1;
    }
    return lines;
}

LineCursor::LineCursor(std::vector<DescriptorLine> lines)
    : lines_(std::move(lines))
{}

const DescriptorLine* LineCursor::peek(size_t offset) const {
    size_t index = position_ + offset;
    return index < lines_.size() ? &lines_[index] : nullptr;
}

const DescriptorLine* LineCursor::findInBody(size_t headerIndent, std::string_view prefix) const {
    for (size_t i = position_; i < lines_.size(); ++i) {
        const auto& line = lines_[i];
        if (line.indent <= headerIndent) break;
        if (line.content.starts_with(prefix)) return &line;
    }
    return nullptr;
}

size_t LineCursor::skipBody(size_t headerIndent) {
    size_t skipped = 0;
    while (inBody(headerIndent)) {
        advance();
        ++skipped;
    }
    return skipped;
}

} // namespace UAC
