// include/UAC/DescriptorParser.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "UAC/Device.hpp"
#include "UAC/Enums.hpp"
#include "UAC/Error.h"

namespace spdlog {
    class logger;
}

namespace UAC {

class LineCursor;
struct InterfaceDescriptor;
struct EndpointDescriptor;

/**
 * @brief Parser configuration.
 */
struct ParserOptions {
    std::shared_ptr<spdlog::logger> logger;        ///< Defaults to spdlog::default_logger()
    std::optional<UacVersion> preferredVersion;    ///< Activate this version when present
};

/**
 * @brief Builds a Device from `lsusb -v` text.
 *
 * Sections are delimited purely by indentation: a header line owns every
 * following line indented deeper than itself. Unknown fields are ignored,
 * unknown sections and descriptor subtypes are skipped, and numeric fields
 * that cannot be decoded become 0. Parsing text never fails.
 */
class DescriptorParser {
public:
    explicit DescriptorParser(ParserOptions options = {});
    ~DescriptorParser() = default;

    DescriptorParser(const DescriptorParser&) = delete;
    DescriptorParser& operator=(const DescriptorParser&) = delete;
    DescriptorParser(DescriptorParser&&) = delete;
    DescriptorParser& operator=(DescriptorParser&&) = delete;

    /**
     * @brief Parse a complete dump.
     * @return Device with every configuration found; may be empty.
     */
    Device parse(std::string_view text) const;

    /**
     * @brief Read a dump from disk and parse it.
     * @return Device, or FileNotFound / ReadFailed / EmptyInput.
     */
    std::expected<Device, AnalyzerError> parseFile(const std::string& path) const;

private:
    void parseDeviceSection(LineCursor& cursor, Device& device) const;
    void parseConfigurationSection(LineCursor& cursor, Device& device) const;
    void parseInterfaceSection(LineCursor& cursor, ConfigurationDescriptor& config) const;
    void parseEndpointSection(LineCursor& cursor, InterfaceDescriptor& iface) const;
    void parseAudioEndpointSection(LineCursor& cursor, EndpointDescriptor& endpoint) const;
    void parseAudioControlSection(LineCursor& cursor, ConfigurationDescriptor& config,
                                  const InterfaceDescriptor& iface) const;
    void parseAudioStreamingSection(LineCursor& cursor, ConfigurationDescriptor& config,
                                    const InterfaceDescriptor& iface) const;
    void skipSection(LineCursor& cursor, std::string_view context) const;
    void finalizeConfiguration(ConfigurationDescriptor& config) const;

    std::shared_ptr<spdlog::logger> logger_;
    std::optional<UacVersion> preferredVersion_;
};

/**
 * @brief Convenience wrapper around DescriptorParser::parse.
 */
Device parseDescriptors(std::string_view text, const ParserOptions& options = {});

} // namespace UAC
