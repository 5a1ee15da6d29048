// include/UAC/FieldDecoder.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace UAC::FieldDecoder {

/**
 * @brief Value decoders for lsusb field text.
 *
 * Each decoder receives the text following the field name and never fails:
 * unparseable numbers decode to 0 and unparseable labels to an empty string.
 */

std::string_view trim(std::string_view text);
std::string_view firstToken(std::string_view value);
std::string_view afterFirstToken(std::string_view value);

uint32_t decodeUnsigned(std::string_view value);
uint32_t decodeHex(std::string_view value);
uint32_t decodeNumber(std::string_view value);  ///< Hex when a "0x" marker is present, else decimal
uint16_t decodeBcd(std::string_view value);   ///< "2.00" -> 0x0200
std::string decodeLabel(std::string_view value);  ///< "2 USB Audio" -> "USB Audio"

bool equalsIgnoreCase(std::string_view a, std::string_view b);

/**
 * @brief One recognized field prefix and the setter that stores its value.
 *
 * A prefix ending in '(' or '[' names an indexed field such as
 * "bmaControls( 1)"; its value is the text after the closing bracket.
 */
template <typename Target>
struct FieldRule {
    std::string_view prefix;
    void (*apply)(Target& target, std::string_view value);
};

namespace detail {
    /**
     * @brief Length of the match of prefix at the start of content, or 0.
     *
     * Comparison is case-insensitive and a plain prefix must end at a token boundary.
     */
    size_t matchPrefix(std::string_view content, std::string_view prefix);

    /**
     * @brief Extract the value text for a matched prefix.
     */
    std::string_view valueAfter(std::string_view content, std::string_view prefix);
}

/**
 * @brief Apply the longest matching rule to one body line.
 * @return true if a rule matched.
 */
template <typename Target>
bool applyField(std::span<const FieldRule<Target>> rules, std::string_view content, Target& target) {
    const FieldRule<Target>* best = nullptr;
    size_t bestLength = 0;
    for (const auto& rule : rules) {
        size_t length = detail::matchPrefix(content, rule.prefix);
        if (length > bestLength) {
            best = &rule;
            bestLength = length;
        }
    }
    if (!best) return false;
    best->apply(target, detail::valueAfter(content, best->prefix));
    return true;
}

template <typename Target, size_t N>
bool applyField(const FieldRule<Target> (&rules)[N], std::string_view content, Target& target) {
    return applyField(std::span<const FieldRule<Target>>(rules, N), content, target);
}

} // namespace UAC::FieldDecoder
