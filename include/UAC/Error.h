// include/UAC/Error.h
// Synopsis: Error codes for operations outside the tolerant descriptor grammar.

#pragma once

#include <system_error>
#include <string>

namespace UAC {

enum class AnalyzerError {
    Success = 0,                // Operation completed successfully
    InvalidArgument,            // Caller supplied an unusable argument
    FileNotFound,               // Input file does not exist
    ReadFailed,                 // Input could not be read
    EmptyInput,                 // Input contained no descriptor lines
    ConfigurationNotFound,      // No configuration with the requested UAC version
    NoAudioControl,             // Active configuration has no AudioControl interface
    InternalError               // Internal error
};

// Make AnalyzerError work with std::error_code
namespace detail {
    struct AnalyzerErrorCategory : std::error_category {
        const char* name() const noexcept override { return "UAC"; }
        std::string message(int ev) const override {
            switch (static_cast<AnalyzerError>(ev)) {
                case AnalyzerError::Success: return "Success";
                case AnalyzerError::InvalidArgument: return "Invalid argument";
                case AnalyzerError::FileNotFound: return "File not found";
                case AnalyzerError::ReadFailed: return "Read failed";
                case AnalyzerError::EmptyInput: return "Input is empty";
                case AnalyzerError::ConfigurationNotFound: return "Configuration not found";
                case AnalyzerError::NoAudioControl: return "No AudioControl interface";
                case AnalyzerError::InternalError: return "Internal error";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& analyzer_error_category() noexcept {
    static detail::AnalyzerErrorCategory category;
    return category;
}

inline std::error_code make_error_code(AnalyzerError e) noexcept {
    return {static_cast<int>(e), analyzer_error_category()};
}

} // namespace UAC

namespace std {
    template<>
    struct is_error_code_enum<UAC::AnalyzerError> : true_type {};
}
