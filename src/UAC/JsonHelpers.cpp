#include "UAC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>

namespace UAC::JsonHelpers {
    std::string uacVersionToString(UacVersion version) {
        switch (version) {
            case UacVersion::UAC1: return "1.0";
            case UacVersion::UAC2: return "2.0";
            case UacVersion::UAC3: return "3.0";
            default: return "Unknown";
        }
    }
    std::string endpointDirectionToString(EndpointDirection dir) {
        return (dir == EndpointDirection::In) ? "IN" : "OUT";
    }
    std::string transferTypeToString(TransferType type) {
        switch (type) {
            case TransferType::Control: return "Control";
            case TransferType::Isochronous: return "Isochronous";
            case TransferType::Bulk: return "Bulk";
            case TransferType::Interrupt: return "Interrupt";
            default: return "Unknown";
        }
    }
    std::string syncTypeToString(SyncType type) {
        switch (type) {
            case SyncType::None: return "None";
            case SyncType::Asynchronous: return "Asynchronous";
            case SyncType::Adaptive: return "Adaptive";
            case SyncType::Synchronous: return "Synchronous";
            default: return "Unknown";
        }
    }
    std::string usageTypeToString(UsageType type) {
        switch (type) {
            case UsageType::Data: return "Data";
            case UsageType::Feedback: return "Feedback";
            case UsageType::ImplicitFeedback: return "Implicit Feedback";
            default: return "Unknown";
        }
    }
    std::string nodeTypeToString(NodeType type) {
        switch (type) {
            case NodeType::InputTerminal: return "InputTerminal";
            case NodeType::OutputTerminal: return "OutputTerminal";
            case NodeType::FeatureUnit: return "FeatureUnit";
            case NodeType::MixerUnit: return "MixerUnit";
            case NodeType::SelectorUnit: return "SelectorUnit";
            case NodeType::ProcessingUnit: return "ProcessingUnit";
            case NodeType::ExtensionUnit: return "ExtensionUnit";
            case NodeType::ClockSource: return "ClockSource";
            case NodeType::ClockSelector: return "ClockSelector";
            case NodeType::ClockMultiplier: return "ClockMultiplier";
            default: {
                std::ostringstream oss;
                oss << "Unknown(0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(type) << ")";
                return oss.str();
            }
        }
    }
    std::string hexString(uint32_t value, int width) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
        return oss.str();
    }

    std::string dumpJson(const json& value, int indent) {
        return value.dump(indent, ' ', false, json::error_handler_t::replace);
    }
}
