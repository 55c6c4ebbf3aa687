#pragma once
#include <string>
#include <variant>

namespace ralph::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., conflicting CLI flags or an unknown harness name
        Execution,  // E.g., the agent binary could not be spawned
        Workspace,  // E.g., state file or config file could not be read/written
        Internal    // E.g., pipe/fork failure or a parsing bug
    };

    // The standardized error payload
    struct LoopError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a LoopError.
    template <typename T>
    using Result = std::variant<T, LoopError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LoopError>(result);
    }

    template <typename T>
    const LoopError& get_error(const Result<T>& result) {
        return std::get<LoopError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Workspace: return "workspace";
            case ErrorCategory::Internal: return "internal";
        }
        return "unknown";
    }

} // namespace ralph::core::errors
