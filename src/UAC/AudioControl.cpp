// AudioControl.cpp
#include "UAC/AudioControl.hpp"
#include "UAC/JsonHelpers.hpp"
#include "UAC/TerminalTypes.hpp"
#include <array>
#include <bit>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace UAC {

using json = nlohmann::json;

namespace {

// Indexed by bit position in the UAC 1.0 layout
constexpr std::array<const char*, 10> kFeatureControlNames = {
    "Mute", "Volume", "Bass", "Mid", "Treble",
    "Graphic EQ", "AGC", "Delay", "Bass Boost", "Loudness"
};

json idList(const std::vector<EntityId>& ids) {
    json arr = json::array();
    for (auto id : ids) arr.push_back(id);
    return arr;
}

} // anonymous namespace

json AudioControlHeader::toJson() const {
    json j;
    j["uacVersion"] = JsonHelpers::uacVersionToString(uacVersion);
    j["bcdADC"] = JsonHelpers::hexString(bcdADC, 4);
    j["totalLength"] = totalLength;
    j["inCollection"] = inCollection;
    j["interfaceNumbers"] = interfaceNumbers;
    if (uacVersion == UacVersion::UAC2) {
        j["category"] = JsonHelpers::hexString(category, 2);
        j["controls"] = JsonHelpers::hexString(controls, 2);
    }
    return j;
}

std::string InputTerminal::terminalTypeName() const {
    return UAC::terminalTypeName(terminalType);
}

json InputTerminal::toJson() const {
    json j;
    j["terminalId"] = terminalId;
    j["terminalType"] = JsonHelpers::hexString(terminalType, 4);
    j["terminalTypeName"] = terminalTypeName();
    j["assocTerminal"] = assocTerminal;
    j["nrChannels"] = nrChannels;
    j["channelConfig"] = JsonHelpers::hexString(channelConfig, 4);
    if (!channelNames.empty()) j["channelNames"] = channelNames;
    if (!terminalName.empty()) j["terminalName"] = terminalName;
    if (clockSourceId) j["clockSourceId"] = clockSourceId;
    j["controls"] = JsonHelpers::hexString(controls, 4);
    return j;
}

std::string OutputTerminal::terminalTypeName() const {
    return UAC::terminalTypeName(terminalType);
}

json OutputTerminal::toJson() const {
    json j;
    j["terminalId"] = terminalId;
    j["terminalType"] = JsonHelpers::hexString(terminalType, 4);
    j["terminalTypeName"] = terminalTypeName();
    j["assocTerminal"] = assocTerminal;
    j["sourceId"] = sourceId;
    if (!terminalName.empty()) j["terminalName"] = terminalName;
    if (clockSourceId) j["clockSourceId"] = clockSourceId;
    j["controls"] = JsonHelpers::hexString(controls, 4);
    return j;
}

bool FeatureUnit::hasControl(uint32_t uac1Bit) const {
    if (controls.empty() || uac1Bit == 0) return false;
    if (controlLayout == UacVersion::UAC2) {
        int index = std::countr_zero(uac1Bit);
        if (index >= 16) return false;
        return ((controls[0] >> (2 * index)) & 0x3) != 0;
    }
    return (controls[0] & uac1Bit) != 0;
}

std::vector<std::string> FeatureUnit::controlNames() const {
    std::vector<std::string> names;
    for (size_t i = 0; i < kFeatureControlNames.size(); ++i) {
        if (hasControl(1u << i)) {
            names.emplace_back(kFeatureControlNames[i]);
        }
    }
    return names;
}

json FeatureUnit::toJson() const {
    json j;
    j["unitId"] = unitId;
    j["sourceId"] = sourceId;
    j["nrChannels"] = nrChannels;
    json ctrls = json::array();
    for (auto c : controls) ctrls.push_back(JsonHelpers::hexString(c, 2));
    j["controls"] = ctrls;
    j["controlNames"] = controlNames();
    if (!unitName.empty()) j["unitName"] = unitName;
    return j;
}

json MixerUnit::toJson() const {
    json j;
    j["unitId"] = unitId;
    j["nrInPins"] = nrInPins;
    j["sourceIds"] = idList(sourceIds);
    j["nrChannels"] = nrChannels;
    j["channelConfig"] = JsonHelpers::hexString(channelConfig, 4);
    if (!channelNames.empty()) j["channelNames"] = channelNames;
    if (!unitName.empty()) j["unitName"] = unitName;
    return j;
}

json SelectorUnit::toJson() const {
    json j;
    j["unitId"] = unitId;
    j["nrInPins"] = nrInPins;
    j["sourceIds"] = idList(sourceIds);
    if (!selectorName.empty()) j["selectorName"] = selectorName;
    return j;
}

std::string ProcessingUnit::processTypeName() const {
    switch (processType) {
        case 0x00: return "Undefined";
        case 0x01: return "Up/Downmix";
        case 0x02: return "Dolby Prologic";
        case 0x03: return "Stereo Extender";
        default: return fmt::format("Process 0x{:02X}", processType);
    }
}

json ProcessingUnit::toJson() const {
    json j;
    j["unitId"] = unitId;
    j["processType"] = JsonHelpers::hexString(processType, 4);
    j["processTypeName"] = processTypeName();
    j["nrInPins"] = nrInPins;
    j["sourceIds"] = idList(sourceIds);
    j["nrChannels"] = nrChannels;
    j["channelConfig"] = JsonHelpers::hexString(channelConfig, 4);
    j["controls"] = JsonHelpers::hexString(controls, 2);
    if (!unitName.empty()) j["unitName"] = unitName;
    return j;
}

json ExtensionUnit::toJson() const {
    json j;
    j["unitId"] = unitId;
    j["extensionCode"] = JsonHelpers::hexString(extensionCode, 4);
    j["nrInPins"] = nrInPins;
    j["sourceIds"] = idList(sourceIds);
    j["nrChannels"] = nrChannels;
    j["channelConfig"] = JsonHelpers::hexString(channelConfig, 4);
    j["controls"] = JsonHelpers::hexString(controls, 2);
    if (!unitName.empty()) j["unitName"] = unitName;
    return j;
}

std::string ClockSource::clockTypeName() const {
    switch (attributes & 0x03) {
        case 0: return "External";
        case 1: return "Internal Fixed";
        case 2: return "Internal Variable";
        default: return "Internal Programmable";
    }
}

json ClockSource::toJson() const {
    json j;
    j["clockId"] = clockId;
    j["attributes"] = JsonHelpers::hexString(attributes, 2);
    j["clockType"] = clockTypeName();
    j["syncedToSof"] = isSyncedToSof();
    j["controls"] = JsonHelpers::hexString(controls, 2);
    j["assocTerminal"] = assocTerminal;
    if (!name.empty()) j["name"] = name;
    return j;
}

json ClockSelector::toJson() const {
    json j;
    j["clockId"] = clockId;
    j["nrInPins"] = nrInPins;
    j["clockPinIds"] = idList(clockPinIds);
    j["controls"] = JsonHelpers::hexString(controls, 2);
    if (!name.empty()) j["name"] = name;
    return j;
}

json ClockMultiplier::toJson() const {
    json j;
    j["clockId"] = clockId;
    j["clockSourceId"] = clockSourceId;
    j["controls"] = JsonHelpers::hexString(controls, 2);
    if (!name.empty()) j["name"] = name;
    return j;
}

EntityId entityId(const AudioEntity& entity) {
    struct Visitor {
        EntityId operator()(const InputTerminal& e) const { return e.terminalId; }
        EntityId operator()(const OutputTerminal& e) const { return e.terminalId; }
        EntityId operator()(const FeatureUnit& e) const { return e.unitId; }
        EntityId operator()(const MixerUnit& e) const { return e.unitId; }
        EntityId operator()(const SelectorUnit& e) const { return e.unitId; }
        EntityId operator()(const ProcessingUnit& e) const { return e.unitId; }
        EntityId operator()(const ExtensionUnit& e) const { return e.unitId; }
        EntityId operator()(const ClockSource& e) const { return e.clockId; }
        EntityId operator()(const ClockSelector& e) const { return e.clockId; }
        EntityId operator()(const ClockMultiplier& e) const { return e.clockId; }
    };
    return std::visit(Visitor{}, entity);
}

NodeType entityNodeType(const AudioEntity& entity) {
    // Alternative order matches the NodeType enumerators
    return static_cast<NodeType>(entity.index());
}

json entityToJson(const AudioEntity& entity) {
    return std::visit([](const auto& e) { return e.toJson(); }, entity);
}

std::optional<AudioEntity> AudioControlInterface::findEntity(EntityId id) const {
    for (const auto& t : inputTerminals) if (t.terminalId == id) return t;
    for (const auto& t : outputTerminals) if (t.terminalId == id) return t;
    for (const auto& u : featureUnits) if (u.unitId == id) return u;
    for (const auto& u : mixerUnits) if (u.unitId == id) return u;
    for (const auto& u : selectorUnits) if (u.unitId == id) return u;
    for (const auto& u : processingUnits) if (u.unitId == id) return u;
    for (const auto& u : extensionUnits) if (u.unitId == id) return u;
    for (const auto& c : clockSources) if (c.clockId == id) return c;
    for (const auto& c : clockSelectors) if (c.clockId == id) return c;
    for (const auto& c : clockMultipliers) if (c.clockId == id) return c;
    return std::nullopt;
}

size_t AudioControlInterface::entityCount() const {
    return inputTerminals.size() + outputTerminals.size() + featureUnits.size() +
           mixerUnits.size() + selectorUnits.size() + processingUnits.size() +
           extensionUnits.size() + clockSources.size() + clockSelectors.size() +
           clockMultipliers.size();
}

json AudioControlInterface::toJson() const {
    auto listToJson = [](const auto& items) {
        json arr = json::array();
        for (const auto& item : items) arr.push_back(item.toJson());
        return arr;
    };

    json j;
    j["interfaceNumber"] = interfaceNumber;
    if (header) j["header"] = header->toJson();
    j["inputTerminals"] = listToJson(inputTerminals);
    j["outputTerminals"] = listToJson(outputTerminals);
    j["featureUnits"] = listToJson(featureUnits);
    j["mixerUnits"] = listToJson(mixerUnits);
    j["selectorUnits"] = listToJson(selectorUnits);
    j["processingUnits"] = listToJson(processingUnits);
    j["extensionUnits"] = listToJson(extensionUnits);
    j["clockSources"] = listToJson(clockSources);
    j["clockSelectors"] = listToJson(clockSelectors);
    j["clockMultipliers"] = listToJson(clockMultipliers);
    return j;
}

} // namespace UAC
