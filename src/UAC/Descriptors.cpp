// Descriptors.cpp
#include "UAC/Descriptors.hpp"
#include "UAC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>

namespace UAC {

using json = nlohmann::json;

json DeviceDescriptor::toJson() const {
    json j;
    j["vendorId"] = JsonHelpers::hexString(vendorId, 4);
    j["productId"] = JsonHelpers::hexString(productId, 4);
    j["bcdDevice"] = JsonHelpers::hexString(bcdDevice, 4);
    j["manufacturer"] = manufacturer;
    j["product"] = product;
    if (!serialNumber.empty()) j["serialNumber"] = serialNumber;
    j["deviceClass"] = deviceClass;
    j["deviceSubClass"] = deviceSubClass;
    j["deviceProtocol"] = deviceProtocol;
    j["maxPacketSize0"] = maxPacketSize0;
    j["numConfigurations"] = numConfigurations;
    j["usbVersion"] = usbVersion;
    return j;
}

json EndpointDescriptor::toJson() const {
    json j;
    j["address"] = JsonHelpers::hexString(address, 2);
    j["endpointNumber"] = endpointNumber();
    j["direction"] = JsonHelpers::endpointDirectionToString(direction);
    j["transferType"] = JsonHelpers::transferTypeToString(transferType);
    if (transferType == TransferType::Isochronous) {
        j["syncType"] = JsonHelpers::syncTypeToString(syncType);
        j["usageType"] = JsonHelpers::usageTypeToString(usageType);
    }
    j["maxPacketSize"] = maxPacketSize;
    j["interval"] = interval;
    if (refresh) j["refresh"] = refresh;
    if (synchAddress) j["synchAddress"] = JsonHelpers::hexString(synchAddress, 2);
    if (lockDelayUnits || lockDelay || maxPacketsOnly) {
        j["lockDelayUnits"] = lockDelayUnits;
        j["lockDelay"] = lockDelay;
        j["maxPacketsOnly"] = maxPacketsOnly;
    }
    return j;
}

json InterfaceDescriptor::toJson() const {
    json j;
    j["interfaceNumber"] = interfaceNumber;
    j["alternateSetting"] = alternateSetting;
    j["numEndpoints"] = numEndpoints;
    j["interfaceClass"] = interfaceClass;
    j["interfaceSubClass"] = interfaceSubClass;
    j["interfaceProtocol"] = interfaceProtocol;
    if (!interfaceName.empty()) j["interfaceName"] = interfaceName;
    json eps = json::array();
    for (const auto& ep : endpoints) {
        eps.push_back(ep.toJson());
    }
    j["endpoints"] = eps;
    return j;
}

} // namespace UAC
