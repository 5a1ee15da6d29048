// include/UAC/AudioControl.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "UAC/Enums.hpp"

namespace UAC {

/// Terminal, unit and clock ids share one namespace per AudioControl interface.
using EntityId = uint8_t;

struct AudioControlHeader {
    UacVersion uacVersion = UacVersion::Unknown;
    uint16_t bcdADC = 0;
    uint16_t totalLength = 0;
    uint8_t inCollection = 0;
    std::vector<uint8_t> interfaceNumbers;   ///< baInterfaceNr list
    uint8_t category = 0;                    ///< UAC 2.0 bCategory
    uint32_t controls = 0;                   ///< UAC 2.0 bmControls

    nlohmann::json toJson() const;
};

struct InputTerminal {
    EntityId terminalId = 0;
    uint16_t terminalType = 0;
    EntityId assocTerminal = 0;
    uint8_t nrChannels = 0;
    uint32_t channelConfig = 0;
    std::string channelNames;
    std::string terminalName;
    EntityId clockSourceId = 0;   ///< UAC 2.0 bCSourceID
    uint32_t controls = 0;

    std::string terminalTypeName() const;
    bool isUsbStreaming() const { return terminalType == kTerminalUsbStreaming; }

    nlohmann::json toJson() const;
};

struct OutputTerminal {
    EntityId terminalId = 0;
    uint16_t terminalType = 0;
    EntityId assocTerminal = 0;
    EntityId sourceId = 0;
    std::string terminalName;
    EntityId clockSourceId = 0;
    uint32_t controls = 0;

    std::string terminalTypeName() const;
    bool isUsbStreaming() const { return terminalType == kTerminalUsbStreaming; }

    nlohmann::json toJson() const;
};

/**
 * @brief Feature unit with one control bitmap per channel.
 *
 * controls[0] is the master channel. The bitmap layout depends on the
 * class version: UAC 1.0 uses one bit per control, UAC 2.0 a pair of bits
 * (readable/writable) per control.
 */
struct FeatureUnit {
    EntityId unitId = 0;
    EntityId sourceId = 0;
    uint8_t nrChannels = 0;
    std::vector<uint32_t> controls;
    std::string unitName;
    UacVersion controlLayout = UacVersion::UAC1;

    bool hasControl(uint32_t uac1Bit) const;
    bool hasMute() const { return hasControl(kFeatureMute); }
    bool hasVolume() const { return hasControl(kFeatureVolume); }
    std::vector<std::string> controlNames() const;

    nlohmann::json toJson() const;
};

struct MixerUnit {
    EntityId unitId = 0;
    uint8_t nrInPins = 0;
    std::vector<EntityId> sourceIds;
    uint8_t nrChannels = 0;
    uint32_t channelConfig = 0;
    std::string channelNames;
    std::string unitName;

    nlohmann::json toJson() const;
};

struct SelectorUnit {
    EntityId unitId = 0;
    uint8_t nrInPins = 0;
    std::vector<EntityId> sourceIds;
    std::string selectorName;

    nlohmann::json toJson() const;
};

struct ProcessingUnit {
    EntityId unitId = 0;
    uint16_t processType = 0;
    uint8_t nrInPins = 0;
    std::vector<EntityId> sourceIds;
    uint8_t nrChannels = 0;
    uint32_t channelConfig = 0;
    std::string channelNames;
    uint32_t controls = 0;
    std::string unitName;

    std::string processTypeName() const;

    nlohmann::json toJson() const;
};

struct ExtensionUnit {
    EntityId unitId = 0;
    uint16_t extensionCode = 0;
    uint8_t nrInPins = 0;
    std::vector<EntityId> sourceIds;
    uint8_t nrChannels = 0;
    uint32_t channelConfig = 0;
    std::string channelNames;
    uint32_t controls = 0;
    std::string unitName;

    nlohmann::json toJson() const;
};

struct ClockSource {
    EntityId clockId = 0;
    uint8_t attributes = 0;
    uint32_t controls = 0;
    EntityId assocTerminal = 0;
    std::string name;

    std::string clockTypeName() const;
    bool isSyncedToSof() const { return (attributes & 0x04) != 0; }

    nlohmann::json toJson() const;
};

struct ClockSelector {
    EntityId clockId = 0;
    uint8_t nrInPins = 0;
    std::vector<EntityId> clockPinIds;
    uint32_t controls = 0;
    std::string name;

    nlohmann::json toJson() const;
};

struct ClockMultiplier {
    EntityId clockId = 0;
    EntityId clockSourceId = 0;
    uint32_t controls = 0;
    std::string name;

    nlohmann::json toJson() const;
};

using AudioEntity = std::variant<
    InputTerminal,
    OutputTerminal,
    FeatureUnit,
    MixerUnit,
    SelectorUnit,
    ProcessingUnit,
    ExtensionUnit,
    ClockSource,
    ClockSelector,
    ClockMultiplier>;

EntityId entityId(const AudioEntity& entity);
NodeType entityNodeType(const AudioEntity& entity);
nlohmann::json entityToJson(const AudioEntity& entity);

/**
 * @brief All class-specific entities of one AudioControl interface.
 */
struct AudioControlInterface {
    uint8_t interfaceNumber = 0;
    uint8_t interfaceProtocol = 0;
    std::optional<AudioControlHeader> header;
    std::vector<InputTerminal> inputTerminals;
    std::vector<OutputTerminal> outputTerminals;
    std::vector<FeatureUnit> featureUnits;
    std::vector<MixerUnit> mixerUnits;
    std::vector<SelectorUnit> selectorUnits;
    std::vector<ProcessingUnit> processingUnits;
    std::vector<ExtensionUnit> extensionUnits;
    std::vector<ClockSource> clockSources;
    std::vector<ClockSelector> clockSelectors;
    std::vector<ClockMultiplier> clockMultipliers;

    /**
     * @brief Look up any terminal, unit or clock entity by id.
     */
    std::optional<AudioEntity> findEntity(EntityId id) const;

    size_t entityCount() const;

    nlohmann::json toJson() const;
};

} // namespace UAC
