// include/UAC/Descriptors.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "UAC/Enums.hpp"

namespace UAC {

/**
 * @brief Standard USB device descriptor as printed by lsusb.
 */
struct DeviceDescriptor {
    uint16_t vendorId = 0;
    uint16_t productId = 0;
    uint16_t bcdDevice = 0;
    std::string manufacturer;   ///< iManufacturer label, else the vendor text after idVendor
    std::string product;        ///< iProduct label, else the product text after idProduct
    std::string serialNumber;
    uint8_t deviceClass = 0;
    uint8_t deviceSubClass = 0;
    uint8_t deviceProtocol = 0;
    uint8_t maxPacketSize0 = 0;
    uint8_t numConfigurations = 0;
    std::string usbVersion;     ///< bcdUSB text, e.g. "2.00"

    nlohmann::json toJson() const;
};

/**
 * @brief Standard endpoint descriptor plus the audio class-specific extension.
 */
struct EndpointDescriptor {
    uint8_t address = 0;
    EndpointDirection direction = EndpointDirection::Out;
    TransferType transferType = TransferType::Control;
    SyncType syncType = SyncType::None;
    UsageType usageType = UsageType::Data;
    uint16_t maxPacketSize = 0;   ///< Low 11 bits of wMaxPacketSize
    uint8_t interval = 0;
    uint8_t refresh = 0;
    uint8_t synchAddress = 0;

    // Class-specific AudioStreaming endpoint fields
    uint8_t lockDelayUnits = 0;
    uint16_t lockDelay = 0;
    bool maxPacketsOnly = false;

    uint8_t endpointNumber() const { return address & 0x0F; }
    bool isInput() const { return direction == EndpointDirection::In; }

    nlohmann::json toJson() const;
};

struct InterfaceDescriptor {
    uint8_t interfaceNumber = 0;
    uint8_t alternateSetting = 0;
    uint8_t numEndpoints = 0;
    uint8_t interfaceClass = 0;
    uint8_t interfaceSubClass = 0;
    uint8_t interfaceProtocol = 0;
    std::string interfaceName;
    std::vector<EndpointDescriptor> endpoints;

    bool isAudioControl() const {
        return interfaceClass == kAudioInterfaceClass && interfaceSubClass == kAudioControlSubclass;
    }
    bool isAudioStreaming() const {
        return interfaceClass == kAudioInterfaceClass && interfaceSubClass == kAudioStreamingSubclass;
    }

    nlohmann::json toJson() const;
};

} // namespace UAC
