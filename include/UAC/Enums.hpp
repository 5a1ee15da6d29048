// include/UAC/Enums.hpp
#pragma once
#include <cstdint>

namespace UAC {

// Audio class interface codes
constexpr uint8_t kAudioInterfaceClass          = 0x01;
constexpr uint8_t kAudioControlSubclass         = 0x01;
constexpr uint8_t kAudioStreamingSubclass       = 0x02;
constexpr uint8_t kInterfaceProtocolVersion0300 = 0x30;

// AudioControl interface descriptor subtypes (UAC 1.0 numbering)
constexpr uint8_t kACHeader          = 0x01;
constexpr uint8_t kACInputTerminal   = 0x02;
constexpr uint8_t kACOutputTerminal  = 0x03;
constexpr uint8_t kACMixerUnit       = 0x04;
constexpr uint8_t kACSelectorUnit    = 0x05;
constexpr uint8_t kACFeatureUnit     = 0x06;
constexpr uint8_t kACProcessingUnit  = 0x07;
constexpr uint8_t kACExtensionUnit   = 0x08;
constexpr uint8_t kACClockSource     = 0x0A;
constexpr uint8_t kACClockSelector   = 0x0B;
constexpr uint8_t kACClockMultiplier = 0x0C;

// UAC 2.0 renumbers the unit subtypes after the feature unit
constexpr uint8_t kAC2EffectUnit          = 0x07;
constexpr uint8_t kAC2ProcessingUnit      = 0x08;
constexpr uint8_t kAC2ExtensionUnit       = 0x09;
constexpr uint8_t kAC2SampleRateConverter = 0x0D;

// AudioStreaming interface descriptor subtypes
constexpr uint8_t kASGeneral        = 0x01;
constexpr uint8_t kASFormatType     = 0x02;
constexpr uint8_t kASFormatSpecific = 0x03;

// bcdADC boundary between UAC 1.0 and UAC 2.0
constexpr uint16_t kBcdADCVersion2 = 0x0200;

// USB streaming terminal type
constexpr uint16_t kTerminalUsbStreaming = 0x0101;

// Feature unit control bits, UAC 1.0 layout (one bit per control)
constexpr uint32_t kFeatureMute      = 0x0001;
constexpr uint32_t kFeatureVolume    = 0x0002;
constexpr uint32_t kFeatureBass      = 0x0004;
constexpr uint32_t kFeatureMid       = 0x0008;
constexpr uint32_t kFeatureTreble    = 0x0010;
constexpr uint32_t kFeatureGraphicEq = 0x0020;
constexpr uint32_t kFeatureAutoGain  = 0x0040;
constexpr uint32_t kFeatureDelay     = 0x0080;
constexpr uint32_t kFeatureBassBoost = 0x0100;
constexpr uint32_t kFeatureLoudness  = 0x0200;

enum class UacVersion : uint8_t {
    Unknown = 0,
    UAC1    = 1,  ///< bcdADC < 0x0200
    UAC2    = 2,  ///< bcdADC >= 0x0200
    UAC3    = 3   ///< interface protocol IP_VERSION_03_00
};

enum class EndpointDirection : uint8_t {
    Out = 0,  ///< Host to device
    In  = 1   ///< Device to host
};

enum class TransferType : uint8_t {
    Control     = 0,
    Isochronous = 1,
    Bulk        = 2,
    Interrupt   = 3
};

enum class SyncType : uint8_t {
    None         = 0,
    Asynchronous = 1,
    Adaptive     = 2,
    Synchronous  = 3
};

enum class UsageType : uint8_t {
    Data             = 0,
    Feedback         = 1,
    ImplicitFeedback = 2   ///< Usage bits 0b11 are reserved and read as Data
};

/**
 * @brief Discriminant for topology graph nodes.
 */
enum class NodeType : uint8_t {
    InputTerminal,
    OutputTerminal,
    FeatureUnit,
    MixerUnit,
    SelectorUnit,
    ProcessingUnit,
    ExtensionUnit,
    ClockSource,
    ClockSelector,
    ClockMultiplier
};

} // namespace UAC
