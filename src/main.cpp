/**
 * @file main.cpp
 * @brief uac_dump: parse `lsusb -v` output and print the audio model and topology as JSON.
 */

#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include "UAC/DescriptorParser.hpp"
#include "UAC/Device.hpp"
#include "UAC/Error.h"
#include "UAC/FieldDecoder.hpp"
#include "UAC/JsonHelpers.hpp"
#include "UAC/TopologyBuilder.hpp"

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitInputError = 1;
constexpr int kExitConfigNotFound = 2;

struct CliOptions {
    std::string inputPath;                  ///< Empty reads stdin
    std::optional<UAC::UacVersion> configVersion;
    bool modelOnly = false;
    bool topologyOnly = false;
    int indent = 2;
    spdlog::level::level_enum logLevel = spdlog::level::info;
};

void printUsage(const char* argv0) {
    std::cout <<
        "Usage: " << argv0 << " [options] [file]\n"
        "\n"
        "Reads `lsusb -v` output from file (or stdin) and prints the USB Audio\n"
        "Class model and signal topology as JSON.\n"
        "\n"
        "Options:\n"
        "  -c, --config <1.0|2.0|3.0>  Select the configuration with this UAC version\n"
        "  -m, --model-only            Print only the parsed descriptor model\n"
        "  -t, --topology-only         Print only the topology graph\n"
        "      --indent <n>            JSON indentation (default 2, -1 for compact)\n"
        "  -v                          Debug logging (repeat or use -vv for trace)\n"
        "  -q                          Only log warnings and errors\n"
        "  -h, --help                  Show this help\n"
        "      --version               Show version\n";
}

std::optional<UAC::UacVersion> parseVersionArg(const std::string& arg) {
    if (arg == "1" || arg == "1.0") return UAC::UacVersion::UAC1;
    if (arg == "2" || arg == "2.0") return UAC::UacVersion::UAC2;
    if (arg == "3" || arg == "3.0") return UAC::UacVersion::UAC3;
    return std::nullopt;
}

// Returns an exit code when the program should stop, nullopt to continue.
std::optional<int> parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return kExitOk;
        } else if (arg == "--version") {
            std::cout << "uac_dump " << kVersion << "\n";
            return kExitOk;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a version\n";
                return kExitInputError;
            }
            auto version = parseVersionArg(argv[++i]);
            if (!version) {
                std::cerr << "Error: " << UAC::make_error_code(UAC::AnalyzerError::InvalidArgument).message()
                          << ": unknown UAC version '" << argv[i] << "'\n";
                return kExitInputError;
            }
            opts.configVersion = version;
        } else if (arg == "-m" || arg == "--model-only") {
            opts.modelOnly = true;
        } else if (arg == "-t" || arg == "--topology-only") {
            opts.topologyOnly = true;
        } else if (arg == "--indent") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --indent requires a number\n";
                return kExitInputError;
            }
            try {
                opts.indent = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid indent '" << argv[i] << "'\n";
                return kExitInputError;
            }
        } else if (arg == "-v") {
            opts.logLevel = (opts.logLevel == spdlog::level::debug) ? spdlog::level::trace : spdlog::level::debug;
        } else if (arg == "-vv") {
            opts.logLevel = spdlog::level::trace;
        } else if (arg == "-q") {
            opts.logLevel = spdlog::level::warn;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            printUsage(argv[0]);
            return kExitInputError;
        } else if (opts.inputPath.empty()) {
            opts.inputPath = (arg == "-") ? std::string() : arg;
        } else {
            std::cerr << "Error: more than one input file given\n";
            return kExitInputError;
        }
    }
    if (opts.modelOnly && opts.topologyOnly) {
        std::cerr << "Error: --model-only and --topology-only are mutually exclusive\n";
        return kExitInputError;
    }
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (auto exitCode = parseArgs(argc, argv, opts)) {
        return *exitCode;
    }

    // JSON goes to stdout, so log to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("uac_dump", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(opts.logLevel);

    UAC::ParserOptions parserOptions;
    parserOptions.logger = logger;
    UAC::DescriptorParser parser(parserOptions);

    UAC::Device device;
    if (opts.inputPath.empty()) {
        std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        if (UAC::FieldDecoder::trim(text).empty()) {
            spdlog::error("No input on stdin: {}", UAC::make_error_code(UAC::AnalyzerError::EmptyInput).message());
            return kExitInputError;
        }
        device = parser.parse(text);
    } else {
        auto result = parser.parseFile(opts.inputPath);
        if (!result) {
            spdlog::error("Cannot load {}: {}", opts.inputPath, UAC::make_error_code(result.error()).message());
            return kExitInputError;
        }
        device = std::move(result.value());
    }

    if (opts.configVersion) {
        auto selected = device.selectConfiguration(*opts.configVersion);
        if (!selected) {
            std::string available;
            for (auto v : device.availableUacVersions()) {
                if (!available.empty()) available += ", ";
                available += UAC::JsonHelpers::uacVersionToString(v);
            }
            spdlog::error("UAC {} configuration not found (available: {})",
                          UAC::JsonHelpers::uacVersionToString(*opts.configVersion),
                          available.empty() ? "none" : available);
            return kExitConfigNotFound;
        }
    }

    if (!device.activeConfiguration()) {
        spdlog::warn("No configuration descriptors found in input");
    } else if (!device.audioControl()) {
        spdlog::warn("Topology will be empty: {}",
                     UAC::make_error_code(UAC::AnalyzerError::NoAudioControl).message());
    }

    spdlog::info("{} ({}) UAC {}", device.deviceName(), device.manufacturerName(),
                 UAC::JsonHelpers::uacVersionToString(device.uacVersion()));

    nlohmann::json output;
    if (opts.topologyOnly) {
        output = UAC::buildTopology(device).toJson();
    } else if (opts.modelOnly) {
        output = device.toJson();
    } else {
        output["device"] = device.toJson();
        output["topology"] = UAC::buildTopology(device).toJson();
    }

    try {
        std::cout << UAC::JsonHelpers::dumpJson(output, opts.indent) << std::endl;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("{} while generating JSON: {}",
                      UAC::make_error_code(UAC::AnalyzerError::InternalError).message(), e.what());
        return kExitInputError;
    }
    return kExitOk;
}
