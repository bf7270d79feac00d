#pragma once

#include <string>
#include <utility>

namespace scriptbox {

// Failure categories surfaced by the core. The transport maps each one to
// a response code; nothing in the core crashes the process.
enum class ErrorKind {
    NONE,
    INVALID_INPUT,         // Bad or missing upload (400)
    BACKEND_UNAVAILABLE,   // Substrate could not provision (500)
    NOT_FOUND,             // Unknown or already cleaned session (404)
    EXECUTION_FAILED,      // Script terminated abnormally, reported by poll
    RETRIEVAL_FAULT,       // Substrate error while reading status or logs (500)
    TEARDOWN_FAULT         // Best-effort destroy failed, recorded only
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::INVALID_INPUT: return "invalid_input";
        case ErrorKind::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::EXECUTION_FAILED: return "execution_failed";
        case ErrorKind::RETRIEVAL_FAULT: return "retrieval_fault";
        case ErrorKind::TEARDOWN_FAULT: return "teardown_fault";
    }
    return "unknown";
}

// Error codes reported by isolation backends
enum class BackendErrorCode {
    NONE,
    NOT_FOUND,      // Environment vanished or was never created
    UNAVAILABLE,    // Substrate unreachable or out of resources
    TIMEOUT,        // Call exceeded its latency bound
    INTERNAL        // Anything else
};

inline const char* to_string(BackendErrorCode code) {
    switch (code) {
        case BackendErrorCode::NONE: return "none";
        case BackendErrorCode::NOT_FOUND: return "not_found";
        case BackendErrorCode::UNAVAILABLE: return "unavailable";
        case BackendErrorCode::TIMEOUT: return "timeout";
        case BackendErrorCode::INTERNAL: return "internal";
    }
    return "unknown";
}

struct BackendResult {
    BackendErrorCode code = BackendErrorCode::NONE;
    std::string message;

    bool ok() const { return code == BackendErrorCode::NONE; }
    bool not_found() const { return code == BackendErrorCode::NOT_FOUND; }

    static BackendResult success() { return {}; }
    static BackendResult failure(BackendErrorCode code, std::string message) {
        BackendResult result;
        result.code = code;
        result.message = std::move(message);
        return result;
    }
};

} // namespace scriptbox
