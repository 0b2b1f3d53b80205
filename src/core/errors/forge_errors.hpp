#pragma once
#include <string>
#include <variant>

namespace neoforge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., empty requirement or unknown CLI flag
        Containment,    // E.g., a tool path resolved outside the project root
        Capacity,       // E.g., the endpoint rate-limited a credential
        Protocol,       // E.g., the model used an invalid tool-call encoding
        Structural,     // E.g., a phase finished without its artifact
        Configuration,  // E.g., no usable API credentials
        Provider,       // E.g., HTTP failure that is not a rate limit
        Execution,      // E.g., a file could not be written
        Internal
    };

    // The standardized error payload
    struct ForgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a ForgeError.
    template <typename T>
    using Result = std::variant<T, ForgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ForgeError>(result);
    }

    template <typename T>
    const ForgeError& get_error(const Result<T>& result) {
        return std::get<ForgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:         return "input";
            case ErrorCategory::Containment:   return "containment";
            case ErrorCategory::Capacity:      return "capacity";
            case ErrorCategory::Protocol:      return "protocol";
            case ErrorCategory::Structural:    return "structural";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Provider:      return "provider";
            case ErrorCategory::Execution:     return "execution";
            case ErrorCategory::Internal:      return "internal";
            default: return "unknown";
        }
    }

} // namespace neoforge::core::errors
