#pragma once
#include <string>
#include <variant>

namespace overseer::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,        // E.g., bad CLI flag or malformed action parameters
        Execution,    // E.g., the agent or environment could not complete a step
        Process,      // E.g., fork/pipe failure while spawning external work
        Persistence,  // E.g., history file could not be written
        Internal      // E.g., C++ logic bug or parsing failure
    };

    // The standardized error payload
    struct Error {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Helpful tips for the operator
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR an Error.
    template <typename T>
    using Result = std::variant<T, Error>;

    // Result for operations that produce nothing on success.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<Error>(result);
    }

    template <typename T>
    const Error& get_error(const Result<T>& result) {
        return std::get<Error>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Process:
                return "process";
            case ErrorCategory::Persistence:
                return "persistence";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace overseer::core::errors
