// FieldDecoder.cpp
#include "UAC/FieldDecoder.hpp"
#include <cctype>
#include <charconv>

namespace UAC::FieldDecoder {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

uint32_t parseDigits(std::string_view digits, int base) {
    uint32_t result = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result, base);
    if (ec != std::errc()) return 0;
    return result;
}

} // anonymous namespace

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin])) ++begin;
    size_t end = text.size();
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::string_view firstToken(std::string_view value) {
    value = trim(value);
    size_t end = 0;
    while (end < value.size() && !isSpace(value[end])) ++end;
    return value.substr(0, end);
}

std::string_view afterFirstToken(std::string_view value) {
    value = trim(value);
    size_t end = 0;
    while (end < value.size() && !isSpace(value[end])) ++end;
    return trim(value.substr(end));
}

uint32_t decodeUnsigned(std::string_view value) {
    auto token = firstToken(value);
    size_t end = 0;
    while (end < token.size() && isDigit(token[end])) ++end;
    if (end == 0) return 0;
    return parseDigits(token.substr(0, end), 10);
}

uint32_t decodeHex(std::string_view value) {
    size_t marker = value.find("0x");
    if (marker == std::string_view::npos) marker = value.find("0X");
    if (marker != std::string_view::npos) {
        size_t begin = marker + 2;
        size_t end = begin;
        while (end < value.size() && isHexDigit(value[end])) ++end;
        if (end == begin) return 0;
        return parseDigits(value.substr(begin, end - begin), 16);
    }

    auto token = firstToken(value);
    if (token.empty()) return 0;
    for (char c : token) {
        if (!isHexDigit(c)) return 0;
    }
    return parseDigits(token, 16);
}

uint32_t decodeNumber(std::string_view value) {
    auto token = firstToken(value);
    if (token.starts_with("0x") || token.starts_with("0X")) return decodeHex(token);
    return decodeUnsigned(token);
}

uint16_t decodeBcd(std::string_view value) {
    // First "digits.digits" run anywhere in the value
    for (size_t i = 0; i < value.size(); ++i) {
        if (!isDigit(value[i])) continue;
        size_t majorEnd = i;
        while (majorEnd < value.size() && isDigit(value[majorEnd])) ++majorEnd;
        if (majorEnd + 1 < value.size() && value[majorEnd] == '.' && isDigit(value[majorEnd + 1])) {
            size_t minorEnd = majorEnd + 1;
            while (minorEnd < value.size() && isDigit(value[minorEnd])) ++minorEnd;
            uint32_t major = parseDigits(value.substr(i, majorEnd - i), 10);
            uint32_t minor = parseDigits(value.substr(majorEnd + 1, minorEnd - majorEnd - 1), 10);
            return static_cast<uint16_t>(((major & 0xFF) << 8) | (minor & 0xFF));
        }
        i = majorEnd;
    }
    return 0;
}

std::string decodeLabel(std::string_view value) {
    auto token = firstToken(value);
    if (token.empty()) return {};
    for (char c : token) {
        if (!isDigit(c)) return {};
    }
    return std::string(afterFirstToken(value));
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

namespace detail {

size_t matchPrefix(std::string_view content, std::string_view prefix) {
    if (prefix.empty() || content.size() < prefix.size()) return 0;
    if (!equalsIgnoreCase(content.substr(0, prefix.size()), prefix)) return 0;
    char last = prefix.back();
    if (last == '(' || last == '[') return prefix.size();
    if (content.size() == prefix.size() || isSpace(content[prefix.size()])) return prefix.size();
    return 0;
}

std::string_view valueAfter(std::string_view content, std::string_view prefix) {
    char last = prefix.back();
    if (last == '(' || last == '[') {
        char closing = (last == '(') ? ')' : ']';
        size_t close = content.find(closing, prefix.size());
        if (close == std::string_view::npos) return {};
        return trim(content.substr(close + 1));
    }
    return trim(content.substr(prefix.size()));
}

} // namespace detail

} // namespace UAC::FieldDecoder
