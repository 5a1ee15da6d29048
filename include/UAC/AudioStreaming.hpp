// include/UAC/AudioStreaming.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "UAC/Descriptors.hpp"

namespace UAC {

constexpr uint8_t kFormatTypeI   = 0x01;
constexpr uint8_t kFormatTypeII  = 0x02;
constexpr uint8_t kFormatTypeIII = 0x03;

// UAC 1.0 wFormatTag values
constexpr uint16_t kFormatTagPcm       = 0x0001;
constexpr uint16_t kFormatTagPcm8      = 0x0002;
constexpr uint16_t kFormatTagIeeeFloat = 0x0003;
constexpr uint16_t kFormatTagALaw      = 0x0004;
constexpr uint16_t kFormatTagMuLaw     = 0x0005;

// UAC 2.0 Type I bmFormats bits
constexpr uint32_t kFormatBitPcm       = 0x00000001;
constexpr uint32_t kFormatBitPcm8      = 0x00000002;
constexpr uint32_t kFormatBitIeeeFloat = 0x00000004;
constexpr uint32_t kFormatBitALaw      = 0x00000008;
constexpr uint32_t kFormatBitMuLaw     = 0x00000010;
constexpr uint32_t kFormatBitRawData   = 0x80000000;

struct FormatTypeDescriptor {
    uint8_t formatType = 0;
    uint8_t nrChannels = 0;
    uint8_t subframeSize = 0;        ///< bSubframeSize (UAC 1.0) or bSubslotSize (UAC 2.0)
    uint8_t bitResolution = 0;
    std::vector<uint32_t> sampleFrequencies;  ///< Discrete rates, in input order
    uint32_t freqMin = 0;            ///< Continuous range, when no discrete rates
    uint32_t freqMax = 0;

    /**
     * @brief Lowest and highest supported rate, (0, 0) when none are declared.
     */
    std::pair<uint32_t, uint32_t> sampleRateRange() const;

    nlohmann::json toJson() const;
};

/**
 * @brief AS_GENERAL descriptor of one streaming interface alternate setting.
 */
struct AudioStreamingInterface {
    uint8_t interfaceNumber = 0;
    uint8_t alternateSetting = 0;
    uint8_t terminalLink = 0;
    uint8_t delay = 0;
    uint16_t formatTag = 0;          ///< UAC 1.0
    uint32_t controls = 0;           ///< UAC 2.0
    uint8_t clockSourceId = 0;       ///< UAC 2.0
    uint32_t formats = 0;            ///< UAC 2.0 bmFormats
    uint8_t nrChannels = 0;          ///< UAC 2.0
    std::optional<FormatTypeDescriptor> format;
    std::optional<EndpointDescriptor> endpoint;

    std::string formatName() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Streaming alternate setting grouped with its format and data endpoint.
 */
struct AlternateSetting {
    uint8_t interfaceNumber = 0;
    uint8_t alternateSetting = 0;
    std::optional<AudioStreamingInterface> streamingInterface;
    std::optional<FormatTypeDescriptor> format;
    std::optional<EndpointDescriptor> endpoint;

    bool isZeroBandwidth() const { return !endpoint || endpoint->maxPacketSize == 0; }
    uint32_t bandwidthBytesPerFrame() const { return endpoint ? endpoint->maxPacketSize : 0; }

    nlohmann::json toJson() const;
};

} // namespace UAC
