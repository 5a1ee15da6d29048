// Device.cpp
#include "UAC/Device.hpp"
#include "UAC/JsonHelpers.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace UAC {

using json = nlohmann::json;

json ConfigurationDescriptor::toJson() const {
    json j;
    j["configValue"] = configValue;
    j["numInterfaces"] = numInterfaces;
    if (!configName.empty()) j["configName"] = configName;
    j["attributes"] = JsonHelpers::hexString(attributes, 2);
    j["maxPowerMilliAmps"] = maxPowerMilliAmps;
    j["uacVersion"] = JsonHelpers::uacVersionToString(uacVersion);

    json ifaces = json::array();
    for (const auto& iface : interfaces) ifaces.push_back(iface.toJson());
    j["interfaces"] = ifaces;

    if (audioControl) j["audioControl"] = audioControl->toJson();

    json streams = json::array();
    for (const auto& as : streamingInterfaces) streams.push_back(as.toJson());
    j["streamingInterfaces"] = streams;

    json alts = json::array();
    for (const auto& alt : alternateSettings) alts.push_back(alt.toJson());
    j["alternateSettings"] = alts;
    return j;
}

Device::Device()
    : logger_(spdlog::default_logger())
{}

const ConfigurationDescriptor* Device::activeConfiguration() const {
    if (!activeIndex_ || *activeIndex_ >= configurations_.size()) return nullptr;
    return &configurations_[*activeIndex_];
}

const AudioControlInterface* Device::audioControl() const {
    const auto* config = activeConfiguration();
    if (!config || !config->audioControl) return nullptr;
    return &*config->audioControl;
}

const std::vector<AudioStreamingInterface>& Device::streamingInterfaces() const {
    static const std::vector<AudioStreamingInterface> kEmpty;
    const auto* config = activeConfiguration();
    return config ? config->streamingInterfaces : kEmpty;
}

const std::vector<AlternateSetting>& Device::alternateSettings() const {
    static const std::vector<AlternateSetting> kEmpty;
    const auto* config = activeConfiguration();
    return config ? config->alternateSettings : kEmpty;
}

UacVersion Device::uacVersion() const {
    const auto* config = activeConfiguration();
    return config ? config->uacVersion : UacVersion::Unknown;
}

std::vector<UacVersion> Device::availableUacVersions() const {
    std::vector<UacVersion> versions;
    for (const auto& config : configurations_) {
        if (config.uacVersion == UacVersion::Unknown) continue;
        if (std::find(versions.begin(), versions.end(), config.uacVersion) == versions.end()) {
            versions.push_back(config.uacVersion);
        }
    }
    return versions;
}

std::expected<void, AnalyzerError> Device::selectConfiguration(UacVersion version) {
    if (version != UacVersion::Unknown) {
        for (size_t i = 0; i < configurations_.size(); ++i) {
            if (configurations_[i].uacVersion == version) {
                activeIndex_ = i;
                logger_->debug("Device: Selected configuration {} (UAC {})",
                               configurations_[i].configValue, JsonHelpers::uacVersionToString(version));
                return {};
            }
        }
    }
    logger_->debug("Device: No configuration with UAC {}", JsonHelpers::uacVersionToString(version));
    return std::unexpected(AnalyzerError::ConfigurationNotFound);
}

void Device::selectDefaultConfiguration() {
    if (configurations_.empty()) {
        activeIndex_.reset();
        return;
    }
    size_t best = 0;
    for (size_t i = 1; i < configurations_.size(); ++i) {
        if (configurations_[i].uacVersion > configurations_[best].uacVersion) {
            best = i;
        }
    }
    activeIndex_ = best;
}

std::string Device::deviceName() const {
    if (!descriptor_.product.empty()) return descriptor_.product;
    return fmt::format("USB Audio Device {:04X}:{:04X}", descriptor_.vendorId, descriptor_.productId);
}

std::string Device::manufacturerName() const {
    return descriptor_.manufacturer.empty() ? "Unknown" : descriptor_.manufacturer;
}

json Device::toJson() const {
    json j;
    j["deviceName"] = deviceName();
    j["manufacturerName"] = manufacturerName();
    j["device"] = descriptor_.toJson();
    j["uacVersion"] = JsonHelpers::uacVersionToString(uacVersion());

    json versions = json::array();
    for (auto v : availableUacVersions()) versions.push_back(JsonHelpers::uacVersionToString(v));
    j["availableUacVersions"] = versions;

    if (const auto* config = activeConfiguration()) {
        j["activeConfiguration"] = config->configValue;
    } else {
        j["activeConfiguration"] = nullptr;
    }

    json configs = json::array();
    for (const auto& config : configurations_) configs.push_back(config.toJson());
    j["configurations"] = configs;
    return j;
}

} // namespace UAC
