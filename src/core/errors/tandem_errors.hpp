#pragma once
#include <string>
#include <utility>
#include <variant>

namespace tandem::core::errors {

    // Typed error categories, one per failure kind the server distinguishes
    enum class ErrorCategory {
        Input,      // Malformed request, bad CLI flag, unknown conversation
        Capacity,   // Worker pool saturated at submission time
        Timeout,    // Remote tool did not answer before its deadline
        Transport,  // Connection closed or write failed
        Protocol,   // Frame could not be decoded or carried no correlation id
        State,      // Illegal state transition (programming error)
        Execution,  // Reasoning loop or a tool failed
        Internal    // Bug or environment failure
    };

    // The standardized error payload
    struct TandemError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a successful value of type T, OR a TandemError.
    template <typename T>
    using Result = std::variant<T, TandemError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TandemError>(result);
    }

    template <typename T>
    const TandemError& get_error(const Result<T>& result) {
        return std::get<TandemError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T&& take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Capacity:  return "capacity";
            case ErrorCategory::Timeout:   return "timeout";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Protocol:  return "protocol";
            case ErrorCategory::State:     return "state";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace tandem::core::errors
