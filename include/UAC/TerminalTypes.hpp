// include/UAC/TerminalTypes.hpp
#pragma once

#include <cstdint>
#include <string>

namespace UAC {

/**
 * @brief Human-readable name for a USB audio terminal type code.
 *
 * Unknown codes fall back to their category from the high byte,
 * formatted as "Category (0xHHHH)".
 */
std::string terminalTypeName(uint16_t terminalType);

} // namespace UAC
