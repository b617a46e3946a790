#pragma once
#include <string>
#include <variant>

namespace agentrt::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Validation,  // E.g., malformed request body or config file
        Handler,     // E.g., the wrapped agent routine threw
        Deployment,  // E.g., service already running or never became ready
        Internal     // E.g., fork/pipe/filesystem failure
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the caller
        };

    // Well-known codes shared across modules
    namespace codes {
        inline constexpr const char* kValidation = "validation_error";
        inline constexpr const char* kHandler = "handler_error";
        inline constexpr const char* kAlreadyRunning = "already_running";
        inline constexpr const char* kDeploymentTimeout = "deployment_timeout";
        inline constexpr const char* kShutdownTimeout = "shutdown_timeout";
        inline constexpr const char* kProcessNotResponding = "process_not_responding";
        inline constexpr const char* kInvalidConfig = "invalid_config";
    }  // namespace codes

    // 2. Propagation strategy: a Result holds either a value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
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
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Handler:    return "handler";
            case ErrorCategory::Deployment: return "deployment";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace agentrt::core::errors
