#pragma once
#include "UAC/Enums.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace UAC::JsonHelpers {
    using json = nlohmann::json;

    std::string uacVersionToString(UacVersion version);
    std::string endpointDirectionToString(EndpointDirection dir);
    std::string transferTypeToString(TransferType type);
    std::string syncTypeToString(SyncType type);
    std::string usageTypeToString(UsageType type);
    std::string nodeTypeToString(NodeType type);
    std::string hexString(uint32_t value, int width);   ///< "0x" plus zero-padded lowercase digits

    // Labels come verbatim from the dump; invalid UTF-8 bytes become U+FFFD.
    std::string dumpJson(const json& value, int indent);
}
