#pragma once

namespace ent::agent {

// Error classes surfaced by the manager, the output filter and the tool layer
enum class ErrorCode {
    NONE,
    VALIDATION,     // bad task, role, model or timeout
    NOT_FOUND,      // unknown agent ID
    PATTERN,        // output filter regex failed to compile
    LIMIT_REACHED   // concurrency cap hit
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:          return "none";
        case ErrorCode::VALIDATION:    return "validation";
        case ErrorCode::NOT_FOUND:     return "not_found";
        case ErrorCode::PATTERN:       return "pattern";
        case ErrorCode::LIMIT_REACHED: return "limit_reached";
        default: return "unknown";
    }
}

inline constexpr const char* kErrAgentNotFound = "agent not found";

} // namespace ent::agent
