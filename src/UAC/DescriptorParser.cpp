// DescriptorParser.cpp
#include "UAC/DescriptorParser.hpp"
#include "UAC/FieldDecoder.hpp"
#include "UAC/JsonHelpers.hpp"
#include "UAC/LineTokenizer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace UAC {

using FieldDecoder::FieldRule;
using FieldDecoder::decodeBcd;
using FieldDecoder::decodeHex;
using FieldDecoder::decodeLabel;
using FieldDecoder::decodeNumber;
using FieldDecoder::decodeUnsigned;

namespace {

constexpr std::string_view kDeviceHeader = "Device Descriptor:";
constexpr std::string_view kConfigurationHeader = "Configuration Descriptor:";
constexpr std::string_view kInterfaceHeader = "Interface Descriptor:";
constexpr std::string_view kEndpointHeader = "Endpoint Descriptor:";
constexpr std::string_view kAudioControlHeader = "AudioControl Interface Descriptor:";
constexpr std::string_view kAudioStreamingHeader = "AudioStreaming Interface Descriptor:";
constexpr std::string_view kAudioStreamingEndpointHeader = "AudioStreaming Endpoint Descriptor:";
constexpr std::string_view kAudioControlEndpointHeader = "AudioControl Endpoint Descriptor:";
constexpr std::string_view kSubtypeField = "bDescriptorSubtype";

// Assign a decoded label only when the string index carried text.
void setLabel(std::string& target, std::string_view value) {
    auto label = decodeLabel(value);
    if (!label.empty()) target = std::move(label);
}

// ---- Standard USB descriptors ----

const FieldRule<DeviceDescriptor> kDeviceFields[] = {
    {"bcdUSB", [](DeviceDescriptor& d, std::string_view v) { d.usbVersion = std::string(FieldDecoder::firstToken(v)); }},
    {"bDeviceClass", [](DeviceDescriptor& d, std::string_view v) { d.deviceClass = decodeUnsigned(v); }},
    {"bDeviceSubClass", [](DeviceDescriptor& d, std::string_view v) { d.deviceSubClass = decodeUnsigned(v); }},
    {"bDeviceProtocol", [](DeviceDescriptor& d, std::string_view v) { d.deviceProtocol = decodeUnsigned(v); }},
    {"bMaxPacketSize0", [](DeviceDescriptor& d, std::string_view v) { d.maxPacketSize0 = decodeUnsigned(v); }},
    {"idVendor", [](DeviceDescriptor& d, std::string_view v) {
        d.vendorId = decodeHex(v);
        auto text = FieldDecoder::afterFirstToken(v);
        if (!text.empty()) d.manufacturer = std::string(text);
    }},
    {"idProduct", [](DeviceDescriptor& d, std::string_view v) {
        d.productId = decodeHex(v);
        auto text = FieldDecoder::afterFirstToken(v);
        if (!text.empty()) d.product = std::string(text);
    }},
    {"bcdDevice", [](DeviceDescriptor& d, std::string_view v) { d.bcdDevice = decodeBcd(v); }},
    {"iManufacturer", [](DeviceDescriptor& d, std::string_view v) { setLabel(d.manufacturer, v); }},
    {"iProduct", [](DeviceDescriptor& d, std::string_view v) { setLabel(d.product, v); }},
    {"iSerial", [](DeviceDescriptor& d, std::string_view v) { setLabel(d.serialNumber, v); }},
    {"bNumConfigurations", [](DeviceDescriptor& d, std::string_view v) { d.numConfigurations = decodeUnsigned(v); }},
};

const FieldRule<ConfigurationDescriptor> kConfigurationFields[] = {
    {"bConfigurationValue", [](ConfigurationDescriptor& c, std::string_view v) { c.configValue = decodeUnsigned(v); }},
    {"bNumInterfaces", [](ConfigurationDescriptor& c, std::string_view v) { c.numInterfaces = decodeUnsigned(v); }},
    {"iConfiguration", [](ConfigurationDescriptor& c, std::string_view v) { c.configName = decodeLabel(v); }},
    {"bmAttributes", [](ConfigurationDescriptor& c, std::string_view v) { c.attributes = decodeHex(v); }},
    {"MaxPower", [](ConfigurationDescriptor& c, std::string_view v) { c.maxPowerMilliAmps = decodeUnsigned(v); }},
};

const FieldRule<InterfaceDescriptor> kInterfaceFields[] = {
    {"bInterfaceNumber", [](InterfaceDescriptor& i, std::string_view v) { i.interfaceNumber = decodeUnsigned(v); }},
    {"bAlternateSetting", [](InterfaceDescriptor& i, std::string_view v) { i.alternateSetting = decodeUnsigned(v); }},
    {"bNumEndpoints", [](InterfaceDescriptor& i, std::string_view v) { i.numEndpoints = decodeUnsigned(v); }},
    {"bInterfaceClass", [](InterfaceDescriptor& i, std::string_view v) { i.interfaceClass = decodeUnsigned(v); }},
    {"bInterfaceSubClass", [](InterfaceDescriptor& i, std::string_view v) { i.interfaceSubClass = decodeUnsigned(v); }},
    {"bInterfaceProtocol", [](InterfaceDescriptor& i, std::string_view v) { i.interfaceProtocol = decodeUnsigned(v); }},
    {"iInterface", [](InterfaceDescriptor& i, std::string_view v) { i.interfaceName = decodeLabel(v); }},
};

const FieldRule<EndpointDescriptor> kEndpointFields[] = {
    {"bEndpointAddress", [](EndpointDescriptor& e, std::string_view v) {
        e.address = decodeHex(v);
        e.direction = (e.address & 0x80) ? EndpointDirection::In : EndpointDirection::Out;
    }},
    {"bmAttributes", [](EndpointDescriptor& e, std::string_view v) {
        uint32_t attrs = decodeNumber(v);
        e.transferType = static_cast<TransferType>(attrs & 0x03);
        if (e.transferType == TransferType::Isochronous) {
            e.syncType = static_cast<SyncType>((attrs >> 2) & 0x03);
            uint32_t usage = (attrs >> 4) & 0x03;
            e.usageType = (usage == 3) ? UsageType::Data : static_cast<UsageType>(usage);
        }
    }},
    {"wMaxPacketSize", [](EndpointDescriptor& e, std::string_view v) { e.maxPacketSize = decodeHex(v) & 0x7FF; }},
    {"bInterval", [](EndpointDescriptor& e, std::string_view v) { e.interval = decodeUnsigned(v); }},
    {"bRefresh", [](EndpointDescriptor& e, std::string_view v) { e.refresh = decodeUnsigned(v); }},
    {"bSynchAddress", [](EndpointDescriptor& e, std::string_view v) { e.synchAddress = decodeNumber(v); }},
};

const FieldRule<EndpointDescriptor> kAudioEndpointFields[] = {
    {"bmAttributes", [](EndpointDescriptor& e, std::string_view v) { e.maxPacketsOnly = (decodeNumber(v) & 0x80) != 0; }},
    {"bLockDelayUnits", [](EndpointDescriptor& e, std::string_view v) { e.lockDelayUnits = decodeUnsigned(v); }},
    {"wLockDelay", [](EndpointDescriptor& e, std::string_view v) { e.lockDelay = decodeNumber(v); }},
};

// ---- AudioControl entities ----

const FieldRule<AudioControlHeader> kHeaderFields[] = {
    {"bcdADC", [](AudioControlHeader& h, std::string_view v) { h.bcdADC = decodeBcd(v); }},
    {"wTotalLength", [](AudioControlHeader& h, std::string_view v) { h.totalLength = decodeNumber(v); }},
    {"bInCollection", [](AudioControlHeader& h, std::string_view v) { h.inCollection = decodeUnsigned(v); }},
    {"baInterfaceNr(", [](AudioControlHeader& h, std::string_view v) { h.interfaceNumbers.push_back(decodeUnsigned(v)); }},
    {"bCategory", [](AudioControlHeader& h, std::string_view v) { h.category = decodeNumber(v); }},
    {"bmControls", [](AudioControlHeader& h, std::string_view v) { h.controls = decodeHex(v); }},
};

const FieldRule<InputTerminal> kInputTerminalFields[] = {
    {"bTerminalID", [](InputTerminal& t, std::string_view v) { t.terminalId = decodeUnsigned(v); }},
    {"wTerminalType", [](InputTerminal& t, std::string_view v) { t.terminalType = decodeHex(v); }},
    {"bAssocTerminal", [](InputTerminal& t, std::string_view v) { t.assocTerminal = decodeUnsigned(v); }},
    {"bNrChannels", [](InputTerminal& t, std::string_view v) { t.nrChannels = decodeUnsigned(v); }},
    {"wChannelConfig", [](InputTerminal& t, std::string_view v) { t.channelConfig = decodeHex(v); }},
    {"bmChannelConfig", [](InputTerminal& t, std::string_view v) { t.channelConfig = decodeHex(v); }},
    {"iChannelNames", [](InputTerminal& t, std::string_view v) { t.channelNames = decodeLabel(v); }},
    {"iTerminal", [](InputTerminal& t, std::string_view v) { t.terminalName = decodeLabel(v); }},
    {"bCSourceID", [](InputTerminal& t, std::string_view v) { t.clockSourceId = decodeUnsigned(v); }},
    {"bmControls", [](InputTerminal& t, std::string_view v) { t.controls = decodeHex(v); }},
};

const FieldRule<OutputTerminal> kOutputTerminalFields[] = {
    {"bTerminalID", [](OutputTerminal& t, std::string_view v) { t.terminalId = decodeUnsigned(v); }},
    {"wTerminalType", [](OutputTerminal& t, std::string_view v) { t.terminalType = decodeHex(v); }},
    {"bAssocTerminal", [](OutputTerminal& t, std::string_view v) { t.assocTerminal = decodeUnsigned(v); }},
    {"bSourceID", [](OutputTerminal& t, std::string_view v) { t.sourceId = decodeUnsigned(v); }},
    {"iTerminal", [](OutputTerminal& t, std::string_view v) { t.terminalName = decodeLabel(v); }},
    {"bCSourceID", [](OutputTerminal& t, std::string_view v) { t.clockSourceId = decodeUnsigned(v); }},
    {"bmControls", [](OutputTerminal& t, std::string_view v) { t.controls = decodeHex(v); }},
};

const FieldRule<FeatureUnit> kFeatureUnitFields[] = {
    {"bUnitID", [](FeatureUnit& u, std::string_view v) { u.unitId = decodeUnsigned(v); }},
    {"bSourceID", [](FeatureUnit& u, std::string_view v) { u.sourceId = decodeUnsigned(v); }},
    {"bmaControls(", [](FeatureUnit& u, std::string_view v) { u.controls.push_back(decodeHex(v)); }},
    {"iFeature", [](FeatureUnit& u, std::string_view v) { u.unitName = decodeLabel(v); }},
};

const FieldRule<MixerUnit> kMixerUnitFields[] = {
    {"bUnitID", [](MixerUnit& u, std::string_view v) { u.unitId = decodeUnsigned(v); }},
    {"bNrInPins", [](MixerUnit& u, std::string_view v) { u.nrInPins = decodeUnsigned(v); }},
    {"baSourceID(", [](MixerUnit& u, std::string_view v) { u.sourceIds.push_back(decodeUnsigned(v)); }},
    {"bNrChannels", [](MixerUnit& u, std::string_view v) { u.nrChannels = decodeUnsigned(v); }},
    {"wChannelConfig", [](MixerUnit& u, std::string_view v) { u.channelConfig = decodeHex(v); }},
    {"bmChannelConfig", [](MixerUnit& u, std::string_view v) { u.channelConfig = decodeHex(v); }},
    {"iChannelNames", [](MixerUnit& u, std::string_view v) { u.channelNames = decodeLabel(v); }},
    {"iMixer", [](MixerUnit& u, std::string_view v) { u.unitName = decodeLabel(v); }},
};

const FieldRule<SelectorUnit> kSelectorUnitFields[] = {
    {"bUnitID", [](SelectorUnit& u, std::string_view v) { u.unitId = decodeUnsigned(v); }},
    {"bNrInPins", [](SelectorUnit& u, std::string_view v) { u.nrInPins = decodeUnsigned(v); }},
    {"baSourceID(", [](SelectorUnit& u, std::string_view v) { u.sourceIds.push_back(decodeUnsigned(v)); }},
    {"iSelector", [](SelectorUnit& u, std::string_view v) { u.selectorName = decodeLabel(v); }},
};

const FieldRule<ProcessingUnit> kProcessingUnitFields[] = {
    {"bUnitID", [](ProcessingUnit& u, std::string_view v) { u.unitId = decodeUnsigned(v); }},
    {"wProcessType", [](ProcessingUnit& u, std::string_view v) { u.processType = decodeHex(v); }},
    {"bNrInPins", [](ProcessingUnit& u, std::string_view v) { u.nrInPins = decodeUnsigned(v); }},
    {"baSourceID(", [](ProcessingUnit& u, std::string_view v) { u.sourceIds.push_back(decodeUnsigned(v)); }},
    {"bNrChannels", [](ProcessingUnit& u, std::string_view v) { u.nrChannels = decodeUnsigned(v); }},
    {"wChannelConfig", [](ProcessingUnit& u, std::string_view v) { u.channelConfig = decodeHex(v); }},
    {"bmChannelConfig", [](ProcessingUnit& u, std::string_view v) { u.channelConfig = decodeHex(v); }},
    {"iChannelNames", [](ProcessingUnit& u, std::string_view v) { u.channelNames = decodeLabel(v); }},
    {"bmControls", [](ProcessingUnit& u, std::string_view v) { u.controls = decodeHex(v); }},
    {"iProcessing", [](ProcessingUnit& u, std::string_view v) { u.unitName = decodeLabel(v); }},
};

const FieldRule<ExtensionUnit> kExtensionUnitFields[] = {
    {"bUnitID", [](ExtensionUnit& u, std::string_view v) { u.unitId = decodeUnsigned(v); }},
    {"wExtensionCode", [](ExtensionUnit& u, std::string_view v) { u.extensionCode = decodeHex(v); }},
    {"bNrInPins", [](ExtensionUnit& u, std::string_view v) { u.nrInPins = decodeUnsigned(v); }},
    {"baSourceID(", [](ExtensionUnit& u, std::string_view v) { u.sourceIds.push_back(decodeUnsigned(v)); }},
    {"bNrChannels", [](ExtensionUnit& u, std::string_view v) { u.nrChannels = decodeUnsigned(v); }},
    {"wChannelConfig", [](ExtensionUnit& u, std::string_view v) { u.channelConfig = decodeHex(v); }},
    {"bmChannelConfig", [](ExtensionUnit& u, std::string_view v) { u.channelConfig = decodeHex(v); }},
    {"iChannelNames", [](ExtensionUnit& u, std::string_view v) { u.channelNames = decodeLabel(v); }},
    {"bmControls", [](ExtensionUnit& u, std::string_view v) { u.controls = decodeHex(v); }},
    {"iExtension", [](ExtensionUnit& u, std::string_view v) { u.unitName = decodeLabel(v); }},
};

const FieldRule<ClockSource> kClockSourceFields[] = {
    {"bClockID", [](ClockSource& c, std::string_view v) { c.clockId = decodeUnsigned(v); }},
    {"bmAttributes", [](ClockSource& c, std::string_view v) { c.attributes = decodeHex(v); }},
    {"bmControls", [](ClockSource& c, std::string_view v) { c.controls = decodeHex(v); }},
    {"bAssocTerminal", [](ClockSource& c, std::string_view v) { c.assocTerminal = decodeUnsigned(v); }},
    {"iClockSource", [](ClockSource& c, std::string_view v) { c.name = decodeLabel(v); }},
};

const FieldRule<ClockSelector> kClockSelectorFields[] = {
    {"bClockID", [](ClockSelector& c, std::string_view v) { c.clockId = decodeUnsigned(v); }},
    {"bNrInPins", [](ClockSelector& c, std::string_view v) { c.nrInPins = decodeUnsigned(v); }},
    {"baCSourceID(", [](ClockSelector& c, std::string_view v) { c.clockPinIds.push_back(decodeUnsigned(v)); }},
    {"bmControls", [](ClockSelector& c, std::string_view v) { c.controls = decodeHex(v); }},
    {"iClockSelector", [](ClockSelector& c, std::string_view v) { c.name = decodeLabel(v); }},
};

const FieldRule<ClockMultiplier> kClockMultiplierFields[] = {
    {"bClockID", [](ClockMultiplier& c, std::string_view v) { c.clockId = decodeUnsigned(v); }},
    {"bCSourceID", [](ClockMultiplier& c, std::string_view v) { c.clockSourceId = decodeUnsigned(v); }},
    {"bmControls", [](ClockMultiplier& c, std::string_view v) { c.controls = decodeHex(v); }},
    {"iClockMultiplier", [](ClockMultiplier& c, std::string_view v) { c.name = decodeLabel(v); }},
};

// ---- AudioStreaming ----

const FieldRule<AudioStreamingInterface> kStreamingGeneralFields[] = {
    {"bTerminalLink", [](AudioStreamingInterface& s, std::string_view v) { s.terminalLink = decodeUnsigned(v); }},
    {"bDelay", [](AudioStreamingInterface& s, std::string_view v) { s.delay = decodeUnsigned(v); }},
    {"wFormatTag", [](AudioStreamingInterface& s, std::string_view v) { s.formatTag = decodeHex(v); }},
    {"bmControls", [](AudioStreamingInterface& s, std::string_view v) { s.controls = decodeHex(v); }},
    {"bmFormats", [](AudioStreamingInterface& s, std::string_view v) { s.formats = decodeHex(v); }},
    {"bNrChannels", [](AudioStreamingInterface& s, std::string_view v) { s.nrChannels = decodeUnsigned(v); }},
    {"bClockSourceID", [](AudioStreamingInterface& s, std::string_view v) { s.clockSourceId = decodeUnsigned(v); }},
};

const FieldRule<FormatTypeDescriptor> kFormatTypeFields[] = {
    {"bFormatType", [](FormatTypeDescriptor& f, std::string_view v) { f.formatType = decodeUnsigned(v); }},
    {"bNrChannels", [](FormatTypeDescriptor& f, std::string_view v) { f.nrChannels = decodeUnsigned(v); }},
    {"bSubframeSize", [](FormatTypeDescriptor& f, std::string_view v) { f.subframeSize = decodeUnsigned(v); }},
    {"bSubslotSize", [](FormatTypeDescriptor& f, std::string_view v) { f.subframeSize = decodeUnsigned(v); }},
    {"bBitResolution", [](FormatTypeDescriptor& f, std::string_view v) { f.bitResolution = decodeUnsigned(v); }},
    {"tSamFreq[", [](FormatTypeDescriptor& f, std::string_view v) { f.sampleFrequencies.push_back(decodeUnsigned(v)); }},
    {"tLowerSamFreq", [](FormatTypeDescriptor& f, std::string_view v) { f.freqMin = decodeUnsigned(v); }},
    {"tUpperSamFreq", [](FormatTypeDescriptor& f, std::string_view v) { f.freqMax = decodeUnsigned(v); }},
};

/**
 * @brief Decode every line of a section body with one field table.
 *
 * Consumes the body, including deeper detail lines, which are ignored.
 */
template <typename Target, size_t N>
void parseFieldBody(LineCursor& cursor, size_t headerIndent, const FieldRule<Target> (&rules)[N],
                    Target& target, spdlog::logger& logger, std::string_view context) {
    while (cursor.inBody(headerIndent)) {
        const auto& line = cursor.current();
        if (!FieldDecoder::applyField(rules, line.content, target)) {
            logger.trace("DescriptorParser: {}: ignoring line {}: '{}'", context, line.lineNumber, line.content);
        }
        cursor.advance();
    }
}

enum class ControlEntityKind {
    Header,
    InputTerminal,
    OutputTerminal,
    MixerUnit,
    SelectorUnit,
    FeatureUnit,
    ProcessingUnit,
    ExtensionUnit,
    ClockSource,
    ClockSelector,
    ClockMultiplier,
    Unsupported
};

ControlEntityKind classifyControlSubtype(uint32_t subtype, bool uac2Numbering) {
    switch (subtype) {
        case kACHeader: return ControlEntityKind::Header;
        case kACInputTerminal: return ControlEntityKind::InputTerminal;
        case kACOutputTerminal: return ControlEntityKind::OutputTerminal;
        case kACMixerUnit: return ControlEntityKind::MixerUnit;
        case kACSelectorUnit: return ControlEntityKind::SelectorUnit;
        case kACFeatureUnit: return ControlEntityKind::FeatureUnit;
        case kACClockSource: return ControlEntityKind::ClockSource;
        case kACClockSelector: return ControlEntityKind::ClockSelector;
        case kACClockMultiplier: return ControlEntityKind::ClockMultiplier;
        default: break;
    }
    if (uac2Numbering) {
        if (subtype == kAC2ProcessingUnit) return ControlEntityKind::ProcessingUnit;
        if (subtype == kAC2ExtensionUnit) return ControlEntityKind::ExtensionUnit;
        return ControlEntityKind::Unsupported;  // effect unit, sample rate converter
    }
    if (subtype == kACProcessingUnit) return ControlEntityKind::ProcessingUnit;
    if (subtype == kACExtensionUnit) return ControlEntityKind::ExtensionUnit;
    return ControlEntityKind::Unsupported;
}

uint32_t scanSubtype(const LineCursor& cursor, size_t headerIndent) {
    const DescriptorLine* line = cursor.findInBody(headerIndent, kSubtypeField);
    if (!line) return 0;
    return decodeUnsigned(std::string_view(line->content).substr(kSubtypeField.size()));
}

UacVersion versionFromHeader(const AudioControlHeader& header, uint8_t interfaceProtocol) {
    if (interfaceProtocol == kInterfaceProtocolVersion0300) return UacVersion::UAC3;
    return header.bcdADC >= kBcdADCVersion2 ? UacVersion::UAC2 : UacVersion::UAC1;
}

} // anonymous namespace

DescriptorParser::DescriptorParser(ParserOptions options)
    : logger_(options.logger ? std::move(options.logger) : spdlog::default_logger())
    , preferredVersion_(options.preferredVersion)
{}

Device DescriptorParser::parse(std::string_view text) const {
    Device device;
    device.logger_ = logger_;
    LineCursor cursor(tokenizeLines(text));
    logger_->debug("DescriptorParser: Parsing {} non-blank lines", cursor.size());

    while (!cursor.atEnd()) {
        const auto& content = cursor.current().content;
        if (content.starts_with(kDeviceHeader)) {
            parseDeviceSection(cursor, device);
        } else if (content.starts_with(kConfigurationHeader)) {
            parseConfigurationSection(cursor, device);
        } else {
            cursor.advance();
        }
    }

    device.selectDefaultConfiguration();
    if (preferredVersion_) {
        auto result = device.selectConfiguration(*preferredVersion_);
        if (!result) {
            logger_->warn("DescriptorParser: Preferred UAC {} not present, keeping UAC {}",
                          JsonHelpers::uacVersionToString(*preferredVersion_),
                          JsonHelpers::uacVersionToString(device.uacVersion()));
        }
    }

    logger_->debug("DescriptorParser: Parsed {} configuration(s), active UAC {}",
                   device.configurations_.size(), JsonHelpers::uacVersionToString(device.uacVersion()));
    return device;
}

std::expected<Device, AnalyzerError> DescriptorParser::parseFile(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logger_->error("DescriptorParser: File not found: {}", path);
        return std::unexpected(AnalyzerError::FileNotFound);
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        logger_->error("DescriptorParser: Cannot open {}", path);
        return std::unexpected(AnalyzerError::ReadFailed);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        logger_->error("DescriptorParser: Read error on {}", path);
        return std::unexpected(AnalyzerError::ReadFailed);
    }

    std::string text = buffer.str();
    if (FieldDecoder::trim(text).empty()) {
        logger_->warn("DescriptorParser: {} is empty", path);
        return std::unexpected(AnalyzerError::EmptyInput);
    }
    return parse(text);
}

void DescriptorParser::parseDeviceSection(LineCursor& cursor, Device& device) const {
    size_t headerIndent = cursor.current().indent;
    logger_->debug("DescriptorParser: Device descriptor at line {}", cursor.current().lineNumber);
    cursor.advance();

    while (cursor.inBody(headerIndent)) {
        const auto& content = cursor.current().content;
        if (content.starts_with(kConfigurationHeader)) {
            parseConfigurationSection(cursor, device);
            continue;
        }
        if (!FieldDecoder::applyField(kDeviceFields, content, device.descriptor_) && content.ends_with(':')) {
            skipSection(cursor, "Device");
            continue;
        }
        cursor.advance();
    }
}

void DescriptorParser::parseConfigurationSection(LineCursor& cursor, Device& device) const {
    size_t headerIndent = cursor.current().indent;
    logger_->debug("DescriptorParser: Configuration descriptor at line {}", cursor.current().lineNumber);
    cursor.advance();

    ConfigurationDescriptor config;
    while (cursor.inBody(headerIndent)) {
        const auto& content = cursor.current().content;
        if (content.starts_with(kInterfaceHeader)) {
            parseInterfaceSection(cursor, config);
            continue;
        }
        if (!FieldDecoder::applyField(kConfigurationFields, content, config) && content.ends_with(':')) {
            skipSection(cursor, "Configuration");
            continue;
        }
        cursor.advance();
    }

    finalizeConfiguration(config);
    device.configurations_.push_back(std::move(config));
}

void DescriptorParser::parseInterfaceSection(LineCursor& cursor, ConfigurationDescriptor& config) const {
    size_t headerIndent = cursor.current().indent;
    cursor.advance();

    InterfaceDescriptor iface;
    while (cursor.inBody(headerIndent)) {
        const auto& content = cursor.current().content;
        if (content.starts_with(kEndpointHeader)) {
            parseEndpointSection(cursor, iface);
        } else if (content.starts_with(kAudioControlHeader)) {
            parseAudioControlSection(cursor, config, iface);
        } else if (content.starts_with(kAudioStreamingHeader)) {
            parseAudioStreamingSection(cursor, config, iface);
        } else if (FieldDecoder::applyField(kInterfaceFields, content, iface)) {
            cursor.advance();
        } else if (content.ends_with(':')) {
            skipSection(cursor, "Interface");
        } else {
            cursor.advance();
        }
    }

    logger_->debug("DescriptorParser: Interface {} alt {} class {} subclass {} ({} endpoints)",
                   iface.interfaceNumber, iface.alternateSetting, iface.interfaceClass,
                   iface.interfaceSubClass, iface.endpoints.size());
    config.interfaces.push_back(std::move(iface));
}

void DescriptorParser::parseEndpointSection(LineCursor& cursor, InterfaceDescriptor& iface) const {
    size_t headerIndent = cursor.current().indent;
    cursor.advance();

    EndpointDescriptor endpoint;
    while (cursor.inBody(headerIndent)) {
        const auto& content = cursor.current().content;
        if (content.starts_with(kAudioStreamingEndpointHeader) || content.starts_with(kAudioControlEndpointHeader)) {
            parseAudioEndpointSection(cursor, endpoint);
        } else if (FieldDecoder::applyField(kEndpointFields, content, endpoint)) {
            cursor.advance();
        } else if (content.ends_with(':')) {
            skipSection(cursor, "Endpoint");
        } else {
            cursor.advance();
        }
    }

    logger_->trace("DescriptorParser: Endpoint 0x{:02x} {} maxPacketSize {}", endpoint.address,
                   JsonHelpers::transferTypeToString(endpoint.transferType), endpoint.maxPacketSize);
    iface.endpoints.push_back(endpoint);
}

void DescriptorParser::parseAudioEndpointSection(LineCursor& cursor, EndpointDescriptor& endpoint) const {
    size_t headerIndent = cursor.current().indent;
    cursor.advance();
    parseFieldBody(cursor, headerIndent, kAudioEndpointFields, endpoint, *logger_, "AudioEndpoint");
}

void DescriptorParser::parseAudioControlSection(LineCursor& cursor, ConfigurationDescriptor& config,
                                                const InterfaceDescriptor& iface) const {
    const DescriptorLine& header = cursor.current();
    size_t headerIndent = header.indent;
    size_t headerLine = header.lineNumber;
    cursor.advance();

    if (!config.audioControl) {
        config.audioControl.emplace();
        config.audioControl->interfaceNumber = iface.interfaceNumber;
        config.audioControl->interfaceProtocol = iface.interfaceProtocol;
    }
    AudioControlInterface& ac = *config.audioControl;

    uint32_t subtype = scanSubtype(cursor, headerIndent);
    bool uac2Numbering = ac.header && ac.header->uacVersion >= UacVersion::UAC2;
    auto kind = classifyControlSubtype(subtype, uac2Numbering);
    logger_->trace("DescriptorParser: AudioControl subtype 0x{:02x} at line {}", subtype, headerLine);

    switch (kind) {
        case ControlEntityKind::Header: {
            AudioControlHeader hdr;
            parseFieldBody(cursor, headerIndent, kHeaderFields, hdr, *logger_, "Header");
            hdr.uacVersion = versionFromHeader(hdr, iface.interfaceProtocol);
            config.uacVersion = hdr.uacVersion;
            logger_->debug("DescriptorParser: AudioControl header bcdADC 0x{:04x} -> UAC {}",
                           hdr.bcdADC, JsonHelpers::uacVersionToString(hdr.uacVersion));
            ac.header = std::move(hdr);
            break;
        }
        case ControlEntityKind::InputTerminal: {
            InputTerminal terminal;
            parseFieldBody(cursor, headerIndent, kInputTerminalFields, terminal, *logger_, "InputTerminal");
            ac.inputTerminals.push_back(std::move(terminal));
            break;
        }
        case ControlEntityKind::OutputTerminal: {
            OutputTerminal terminal;
            parseFieldBody(cursor, headerIndent, kOutputTerminalFields, terminal, *logger_, "OutputTerminal");
            ac.outputTerminals.push_back(std::move(terminal));
            break;
        }
        case ControlEntityKind::FeatureUnit: {
            FeatureUnit unit;
            unit.controlLayout = uac2Numbering ? UacVersion::UAC2 : UacVersion::UAC1;
            parseFieldBody(cursor, headerIndent, kFeatureUnitFields, unit, *logger_, "FeatureUnit");
            unit.nrChannels = unit.controls.empty() ? 0 : static_cast<uint8_t>(unit.controls.size() - 1);
            ac.featureUnits.push_back(std::move(unit));
            break;
        }
        case ControlEntityKind::MixerUnit: {
            MixerUnit unit;
            parseFieldBody(cursor, headerIndent, kMixerUnitFields, unit, *logger_, "MixerUnit");
            ac.mixerUnits.push_back(std::move(unit));
            break;
        }
        case ControlEntityKind::SelectorUnit: {
            SelectorUnit unit;
            parseFieldBody(cursor, headerIndent, kSelectorUnitFields, unit, *logger_, "SelectorUnit");
            ac.selectorUnits.push_back(std::move(unit));
            break;
        }
        case ControlEntityKind::ProcessingUnit: {
            ProcessingUnit unit;
            parseFieldBody(cursor, headerIndent, kProcessingUnitFields, unit, *logger_, "ProcessingUnit");
            ac.processingUnits.push_back(std::move(unit));
            break;
        }
        case ControlEntityKind::ExtensionUnit: {
            ExtensionUnit unit;
            parseFieldBody(cursor, headerIndent, kExtensionUnitFields, unit, *logger_, "ExtensionUnit");
            ac.extensionUnits.push_back(std::move(unit));
            break;
        }
        case ControlEntityKind::ClockSource: {
            ClockSource clock;
            parseFieldBody(cursor, headerIndent, kClockSourceFields, clock, *logger_, "ClockSource");
            ac.clockSources.push_back(std::move(clock));
            break;
        }
        case ControlEntityKind::ClockSelector: {
            ClockSelector clock;
            parseFieldBody(cursor, headerIndent, kClockSelectorFields, clock, *logger_, "ClockSelector");
            ac.clockSelectors.push_back(std::move(clock));
            break;
        }
        case ControlEntityKind::ClockMultiplier: {
            ClockMultiplier clock;
            parseFieldBody(cursor, headerIndent, kClockMultiplierFields, clock, *logger_, "ClockMultiplier");
            ac.clockMultipliers.push_back(std::move(clock));
            break;
        }
        case ControlEntityKind::Unsupported: {
            size_t skipped = cursor.skipBody(headerIndent);
            logger_->warn("DescriptorParser: Skipping AudioControl subtype 0x{:02x} at line {} ({} lines)",
                          subtype, headerLine, skipped);
            break;
        }
    }
}

void DescriptorParser::parseAudioStreamingSection(LineCursor& cursor, ConfigurationDescriptor& config,
                                                  const InterfaceDescriptor& iface) const {
    const DescriptorLine& header = cursor.current();
    size_t headerIndent = header.indent;
    size_t headerLine = header.lineNumber;
    cursor.advance();

    uint32_t subtype = scanSubtype(cursor, headerIndent);
    if (subtype == kASGeneral) {
        AudioStreamingInterface streaming;
        streaming.interfaceNumber = iface.interfaceNumber;
        streaming.alternateSetting = iface.alternateSetting;
        parseFieldBody(cursor, headerIndent, kStreamingGeneralFields, streaming, *logger_, "AS_GENERAL");
        logger_->debug("DescriptorParser: AS_GENERAL interface {} alt {} link {} format {}",
                       streaming.interfaceNumber, streaming.alternateSetting,
                       streaming.terminalLink, streaming.formatName());
        config.streamingInterfaces.push_back(std::move(streaming));
    } else if (subtype == kASFormatType) {
        FormatTypeDescriptor format;
        parseFieldBody(cursor, headerIndent, kFormatTypeFields, format, *logger_, "FORMAT_TYPE");
        if (config.streamingInterfaces.empty()) {
            logger_->warn("DescriptorParser: FORMAT_TYPE at line {} has no preceding AS_GENERAL, dropped", headerLine);
            return;
        }
        auto& streaming = config.streamingInterfaces.back();
        if (format.nrChannels == 0) {
            format.nrChannels = streaming.nrChannels;
        }
        streaming.format = std::move(format);
    } else {
        size_t skipped = cursor.skipBody(headerIndent);
        logger_->warn("DescriptorParser: Skipping AudioStreaming subtype 0x{:02x} at line {} ({} lines)",
                       subtype, headerLine, skipped);
    }
}

void DescriptorParser::skipSection(LineCursor& cursor, std::string_view context) const {
    const DescriptorLine& header = cursor.current();
    size_t headerIndent = header.indent;
    logger_->trace("DescriptorParser: {}: skipping section '{}' at line {}", context, header.content, header.lineNumber);
    cursor.advance();
    cursor.skipBody(headerIndent);
}

void DescriptorParser::finalizeConfiguration(ConfigurationDescriptor& config) const {
    for (auto& streaming : config.streamingInterfaces) {
        AlternateSetting alt;
        alt.interfaceNumber = streaming.interfaceNumber;
        alt.alternateSetting = streaming.alternateSetting;
        alt.format = streaming.format;

        auto iface = std::find_if(config.interfaces.begin(), config.interfaces.end(),
            [&streaming](const InterfaceDescriptor& i) {
                return i.interfaceNumber == streaming.interfaceNumber &&
                       i.alternateSetting == streaming.alternateSetting;
            });
        if (iface != config.interfaces.end() && !iface->endpoints.empty()) {
            auto data = std::find_if(iface->endpoints.begin(), iface->endpoints.end(),
                [](const EndpointDescriptor& e) { return e.usageType == UsageType::Data; });
            streaming.endpoint = (data != iface->endpoints.end()) ? *data : iface->endpoints.front();
        }
        alt.endpoint = streaming.endpoint;
        alt.streamingInterface = streaming;
        config.alternateSettings.push_back(std::move(alt));
    }

    std::stable_sort(config.alternateSettings.begin(), config.alternateSettings.end(),
        [](const AlternateSetting& a, const AlternateSetting& b) {
            if (a.interfaceNumber != b.interfaceNumber) return a.interfaceNumber < b.interfaceNumber;
            return a.alternateSetting < b.alternateSetting;
        });

    if (config.audioControl && !config.audioControl->header) {
        logger_->warn("DescriptorParser: Configuration {} has AudioControl entities but no header",
                      config.configValue);
        config.uacVersion = UacVersion::Unknown;
    }

    logger_->debug("DescriptorParser: Configuration {} UAC {}: {} interfaces, {} entities, {} alternate settings",
                   config.configValue, JsonHelpers::uacVersionToString(config.uacVersion),
                   config.interfaces.size(),
                   config.audioControl ? config.audioControl->entityCount() : 0,
                   config.alternateSettings.size());
}

Device parseDescriptors(std::string_view text, const ParserOptions& options) {
    DescriptorParser parser(options);
    return parser.parse(text);
}

} // namespace UAC
