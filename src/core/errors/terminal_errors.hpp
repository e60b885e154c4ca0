#pragma once
#include <string>
#include <variant>

namespace terminal::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., Malformed arguments or an invalid CLI flag
        NotFound,   // E.g., Unknown tool name or session ID
        Execution,  // E.g., The shell could not be spawned
        Transport,  // E.g., The event stream peer went away
        Internal    // E.g., C++ logic bug or resource exhaustion
    };

    // The standardized error payload
    struct TerminalError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // Marker value for operations that only succeed or fail
    struct Done {};

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a TerminalError.
    template <typename T>
    using Result = std::variant<T, TerminalError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TerminalError>(result);
    }

    template <typename T>
    const TerminalError& get_error(const Result<T>& result) {
        return std::get<TerminalError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::NotFound:
                return "not_found";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Transport:
                return "transport";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace terminal::core::errors
