#pragma once
#include <string>
#include <variant>

namespace usbide::core::errors {

    // 1. Typed error categories, one per failure stage of an invocation
    enum class ErrorCategory {
        Input,        // E.g., the front end got an unknown flag
        Resolution,   // E.g., no portable install and nothing on PATH
        Environment,  // E.g., the process environment block is unavailable
        Argv,         // E.g., exec requested with an empty prompt
        Spawn,        // E.g., the OS refused to create the child process
        ProcessExit,  // E.g., the assistant exited with a non-zero code
        Protocol,     // E.g., a line of output is not valid JSON
        Auth,         // E.g., `login status` failed before exec
        Internal      // E.g., an invocation is already in flight
    };

    // The standardized error payload
    struct CodexError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Actionable sentence shown to the user
    };

    // 2. Propagation strategy: a Result holds either a value or a CodexError
    template <typename T>
    using Result = std::variant<T, CodexError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CodexError>(result);
    }

    template <typename T>
    const CodexError& get_error(const Result<T>& result) {
        return std::get<CodexError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Resolution: return "resolution";
            case ErrorCategory::Environment: return "environment";
            case ErrorCategory::Argv: return "argv";
            case ErrorCategory::Spawn: return "spawn";
            case ErrorCategory::ProcessExit: return "process_exit";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Auth: return "auth";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace usbide::core::errors
