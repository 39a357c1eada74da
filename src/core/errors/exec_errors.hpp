#pragma once
#include <string>
#include <utility>
#include <variant>

namespace snipexec::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag or config value
        Execution,  // E.g., the interpreter could not be launched
        Session,    // E.g., opening an id that is already live
        Internal    // E.g., pipe, fork or temp file failure
    };

    // The standardized error payload
    struct ExecError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR an ExecError.
    template <typename T>
    using Result = std::variant<T, ExecError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ExecError>(result);
    }

    template <typename T>
    const ExecError& get_error(const Result<T>& result) {
        return std::get<ExecError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Moves the value out, for move-only payloads such as scoped files.
    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Session:   return "session";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace snipexec::core::errors
