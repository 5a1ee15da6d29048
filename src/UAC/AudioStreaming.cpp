// AudioStreaming.cpp
#include "UAC/AudioStreaming.hpp"
#include "UAC/JsonHelpers.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace UAC {

using json = nlohmann::json;

std::pair<uint32_t, uint32_t> FormatTypeDescriptor::sampleRateRange() const {
    if (!sampleFrequencies.empty()) {
        auto [lo, hi] = std::minmax_element(sampleFrequencies.begin(), sampleFrequencies.end());
        return {*lo, *hi};
    }
    if (freqMin && freqMax) {
        return {freqMin, freqMax};
    }
    return {0, 0};
}

json FormatTypeDescriptor::toJson() const {
    json j;
    j["formatType"] = formatType;
    j["nrChannels"] = nrChannels;
    j["subframeSize"] = subframeSize;
    j["bitResolution"] = bitResolution;
    if (!sampleFrequencies.empty()) {
        j["sampleFrequencies"] = sampleFrequencies;
    } else if (freqMin || freqMax) {
        j["freqMin"] = freqMin;
        j["freqMax"] = freqMax;
    }
    return j;
}

std::string AudioStreamingInterface::formatName() const {
    if (formats) {
        std::vector<std::string> names;
        if (formats & kFormatBitPcm) names.emplace_back("PCM");
        if (formats & kFormatBitPcm8) names.emplace_back("PCM8");
        if (formats & kFormatBitIeeeFloat) names.emplace_back("IEEE Float");
        if (formats & kFormatBitALaw) names.emplace_back("A-Law");
        if (formats & kFormatBitMuLaw) names.emplace_back("μ-Law");
        if (formats & kFormatBitRawData) names.emplace_back("Raw Data");
        if (names.empty()) {
            return fmt::format("Unknown (0x{:08X})", formats);
        }
        std::string joined;
        for (const auto& name : names) {
            if (!joined.empty()) joined += "/";
            joined += name;
        }
        return joined;
    }

    switch (formatTag) {
        case 0x0000: return "Undefined";
        case kFormatTagPcm: return "PCM";
        case kFormatTagPcm8: return "PCM8";
        case kFormatTagIeeeFloat: return "IEEE Float";
        case kFormatTagALaw: return "A-Law";
        case kFormatTagMuLaw: return "μ-Law";
        default: return fmt::format("Unknown (0x{:04X})", formatTag);
    }
}

json AudioStreamingInterface::toJson() const {
    json j;
    j["interfaceNumber"] = interfaceNumber;
    j["alternateSetting"] = alternateSetting;
    j["terminalLink"] = terminalLink;
    j["delay"] = delay;
    j["formatTag"] = JsonHelpers::hexString(formatTag, 4);
    j["formatName"] = formatName();
    if (formats) {
        j["formats"] = JsonHelpers::hexString(formats, 8);
        j["clockSourceId"] = clockSourceId;
        j["nrChannels"] = nrChannels;
    }
    if (format) j["format"] = format->toJson();
    if (endpoint) j["endpoint"] = endpoint->toJson();
    return j;
}

json AlternateSetting::toJson() const {
    json j;
    j["interfaceNumber"] = interfaceNumber;
    j["alternateSetting"] = alternateSetting;
    j["zeroBandwidth"] = isZeroBandwidth();
    j["bytesPerFrame"] = bandwidthBytesPerFrame();
    if (streamingInterface) j["formatName"] = streamingInterface->formatName();
    if (format) j["format"] = format->toJson();
    if (endpoint) j["endpoint"] = endpoint->toJson();
    return j;
}

} // namespace UAC
