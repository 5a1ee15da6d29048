// TerminalTypes.cpp
#include "UAC/TerminalTypes.hpp"
#include <array>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace UAC {

std::string terminalTypeName(uint16_t terminalType) {
    static constexpr std::array<std::pair<uint16_t, const char*>, 60> kNames = {{
        {0x0100, "USB Undefined"},
        {0x0101, "USB Streaming"},
        {0x01FF, "USB Vendor Specific"},
        {0x0200, "Input Undefined"},
        {0x0201, "Microphone"},
        {0x0202, "Desktop Microphone"},
        {0x0203, "Personal Microphone"},
        {0x0204, "Omni-directional Microphone"},
        {0x0205, "Microphone Array"},
        {0x0206, "Processing Microphone Array"},
        {0x0300, "Output Undefined"},
        {0x0301, "Speaker"},
        {0x0302, "Headphones"},
        {0x0303, "Head Mounted Display Audio"},
        {0x0304, "Desktop Speaker"},
        {0x0305, "Room Speaker"},
        {0x0306, "Communication Speaker"},
        {0x0307, "Low Frequency Effects Speaker"},
        {0x0400, "Bi-directional Undefined"},
        {0x0401, "Handset"},
        {0x0402, "Headset"},
        {0x0403, "Speakerphone (no echo reduction)"},
        {0x0404, "Echo-suppressing Speakerphone"},
        {0x0405, "Echo-canceling Speakerphone"},
        {0x0500, "Telephony Undefined"},
        {0x0501, "Phone Line"},
        {0x0502, "Telephone"},
        {0x0503, "Down Line Phone"},
        {0x0600, "External Undefined"},
        {0x0601, "Analog Connector"},
        {0x0602, "Digital Audio Interface"},
        {0x0603, "Line Connector"},
        {0x0604, "Legacy Audio Connector"},
        {0x0605, "S/PDIF Interface"},
        {0x0606, "1394 DA Stream"},
        {0x0607, "1394 DV Stream"},
        {0x0700, "Embedded Undefined"},
        {0x0701, "Level Calibration Noise Source"},
        {0x0702, "Equalization Noise"},
        {0x0703, "CD Player"},
        {0x0704, "DAT"},
        {0x0705, "DCC"},
        {0x0706, "MiniDisk"},
        {0x0707, "Analog Tape"},
        {0x0708, "Phonograph"},
        {0x0709, "VCR Audio"},
        {0x070A, "Video Disc Audio"},
        {0x070B, "DVD Audio"},
        {0x070C, "TV Tuner Audio"},
        {0x070D, "Satellite Receiver Audio"},
        {0x070E, "Cable Tuner Audio"},
        {0x070F, "DSS Audio"},
        {0x0710, "Radio Receiver"},
        {0x0711, "Radio Transmitter"},
        {0x0712, "Multi-track Recorder"},
        {0x0713, "Synthesizer"},
        {0x0714, "Piano"},
        {0x0715, "Guitar"},
        {0x0716, "Drums/Rhythm"},
        {0x0717, "Other Musical Instrument"},
    }};

    for (const auto& [code, name] : kNames) {
        if (code == terminalType) return name;
    }

    const char* category = "Unknown";
    switch ((terminalType >> 8) & 0xFF) {
        case 0x01: category = "USB"; break;
        case 0x02: category = "Input"; break;
        case 0x03: category = "Output"; break;
        case 0x04: category = "Bi-directional"; break;
        case 0x05: category = "Telephony"; break;
        case 0x06: category = "External"; break;
        case 0x07: category = "Embedded"; break;
        default: break;
    }
    return fmt::format("{} (0x{:04X})", category, terminalType);
}

} // namespace UAC
