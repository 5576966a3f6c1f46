#pragma once
#include <string>
#include <variant>
#include <vector>

namespace orch::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,         // E.g., unknown CLI flag or bad request body
        Validation,    // E.g., an issue type failed schema validation
        NotFound,      // E.g., ticket, issue type, collection or agent id
        Conflict,      // E.g., ticket already claimed, session already exists
        Precondition,  // E.g., tmux missing, no LLM tool, docker without image
        Permission,    // E.g., attempt to modify a builtin issue type
        External,      // E.g., git, filesystem or notification failures
        Malformed,     // E.g., unparseable frontmatter or status block
        Internal       // E.g., logic bug
    };

    // The standardized error payload
    struct OrchError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Remediation text shown to the user
    };

    // A Result holds either a successful value of type T, OR an OrchError.
    template <typename T>
    using Result = std::variant<T, OrchError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<OrchError>(result);
    }

    template <typename T>
    const OrchError& get_error(const Result<T>& result) {
        return std::get<OrchError>(result);
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
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::Conflict: return "conflict";
            case ErrorCategory::Precondition: return "precondition";
            case ErrorCategory::Permission: return "permission";
            case ErrorCategory::External: return "external";
            case ErrorCategory::Malformed: return "malformed";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // "[code] message" plus the hint on its own line, for CLI output.
    inline std::string describe(const OrchError& error) {
        std::string text = "[" + error.code + "] " + error.message;
        if (!error.hint.empty()) {
            text += "\n  hint: " + error.hint;
        }
        return text;
    }

} // namespace orch::core::errors
