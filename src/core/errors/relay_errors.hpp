#pragma once
#include <string>
#include <variant>

namespace relay::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag or config value
        Decode,     // E.g., descriptor envelope is missing a required field
        Policy,     // E.g., security gate denied the request
        Integrity,  // E.g., response digest does not match its body
        Timeout,    // E.g., no response appeared before the deadline
        Transport,  // E.g., outbound call failed to connect
        Storage,    // E.g., shared directory not writable
        Internal    // E.g., C++ logic bug or unexpected exception
    };

    // The standardized error payload
    struct RelayError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a RelayError.
    template <typename T>
    using Result = std::variant<T, RelayError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RelayError>(result);
    }

    template <typename T>
    const RelayError& get_error(const Result<T>& result) {
        return std::get<RelayError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Decode:    return "decode";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Integrity: return "integrity";
            case ErrorCategory::Timeout:   return "timeout";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Storage:   return "storage";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace relay::core::errors
