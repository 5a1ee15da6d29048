// include/UAC/Device.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "UAC/AudioControl.hpp"
#include "UAC/AudioStreaming.hpp"
#include "UAC/Descriptors.hpp"
#include "UAC/Error.h"

namespace spdlog {
    class logger;
}

namespace UAC {

class DescriptorParser;

/**
 * @brief One configuration of the device and everything parsed beneath it.
 */
struct ConfigurationDescriptor {
    uint8_t configValue = 0;
    uint8_t numInterfaces = 0;
    std::string configName;
    uint8_t attributes = 0;
    uint16_t maxPowerMilliAmps = 0;
    std::vector<InterfaceDescriptor> interfaces;
    std::optional<AudioControlInterface> audioControl;
    std::vector<AudioStreamingInterface> streamingInterfaces;
    std::vector<AlternateSetting> alternateSettings;   ///< Sorted by (interface, alternate setting)
    UacVersion uacVersion = UacVersion::Unknown;

    nlohmann::json toJson() const;
};

/**
 * @brief Parsed USB audio device.
 *
 * Holds every configuration found in the dump. Exactly one configuration is
 * active whenever at least one exists. Parsed data is read-only; only the
 * active selection can change after parsing.
 */
class Device {
    friend class DescriptorParser;

public:
    Device();

    const DeviceDescriptor& getDeviceDescriptor() const { return descriptor_; }
    const std::vector<ConfigurationDescriptor>& getConfigurations() const { return configurations_; }

    /**
     * @brief Currently active configuration, or nullptr if none was parsed.
     */
    const ConfigurationDescriptor* activeConfiguration() const;

    /**
     * @brief AudioControl interface of the active configuration, or nullptr.
     */
    const AudioControlInterface* audioControl() const;

    const std::vector<AudioStreamingInterface>& streamingInterfaces() const;
    const std::vector<AlternateSetting>& alternateSettings() const;

    UacVersion uacVersion() const;

    /**
     * @brief Distinct UAC versions present, in configuration order.
     */
    std::vector<UacVersion> availableUacVersions() const;

    /**
     * @brief Make the first configuration with the given version active.
     *
     * Leaves the current selection untouched when no configuration matches.
     * UacVersion::Unknown is never selectable.
     */
    std::expected<void, AnalyzerError> selectConfiguration(UacVersion version);

    std::string deviceName() const;
    std::string manufacturerName() const;

    nlohmann::json toJson() const;

private:
    void selectDefaultConfiguration();

    DeviceDescriptor descriptor_;
    std::vector<ConfigurationDescriptor> configurations_;
    std::optional<size_t> activeIndex_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace UAC
