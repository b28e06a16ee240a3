#pragma once
#include <string>
#include <variant>

namespace sysintent::core::errors {

    // 1. Typed error categories, one per pipeline stage
    enum class ErrorCategory {
        Input,       // E.g., bad CLI flag or unreadable input file
        Config,      // E.g., settings or policy file failed to load
        Validation,  // E.g., a Command field contains a shell metacharacter
        Parse,       // E.g., model output is not JSON or names an unknown action
        Execution,   // E.g., a child process could not be spawned
        Audit,       // E.g., the audit log cannot be appended to
        Internal     // E.g., pipe/fork failure or a logic bug
    };

    // The standardized error payload
    struct PipelineError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a PipelineError.
    template <typename T>
    using Result = std::variant<T, PipelineError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<PipelineError>(result);
    }

    template <typename T>
    const PipelineError& get_error(const Result<T>& result) {
        return std::get<PipelineError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline Status ok() {
        return std::monostate{};
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Config:     return "config";
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Parse:      return "parse";
            case ErrorCategory::Execution:  return "execution";
            case ErrorCategory::Audit:      return "audit";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace sysintent::core::errors
