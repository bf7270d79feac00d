#pragma once

#include <string>
#include <optional>
#include <chrono>

namespace scriptbox {

enum class SessionStatus {
    PENDING,      // Created, backend has not accepted the launch yet
    RUNNING,      // Script executing inside its environment
    COMPLETED,    // Exited with code 0, logs cached
    FAILED,       // Exited abnormally, reason recorded
    CLEANED_UP    // Environment destroyed (terminal)
};

inline const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING: return "pending";
        case SessionStatus::RUNNING: return "running";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::FAILED: return "failed";
        case SessionStatus::CLEANED_UP: return "cleaned_up";
    }
    return "unknown";
}

inline bool is_finished(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::FAILED;
}

// One submitted script, from provisioning to cleanup
struct Session {
    std::string id;                        // External handle, never reused
    std::string backend_handle;            // Owned isolated environment
    SessionStatus status = SessionStatus::PENDING;

    std::string filename;                  // Name given by the uploader
    std::string artifact_sha256;           // Digest of the uploaded bytes

    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_checked_at;
    std::chrono::steady_clock::time_point finished_at;

    std::optional<std::string> cached_logs;   // Write-once after completion
    std::optional<int> exit_code;
    std::string error;                         // Set on FAILED

    // Last time anyone showed interest in this session
    std::chrono::steady_clock::time_point last_activity() const {
        return last_checked_at > created_at ? last_checked_at : created_at;
    }
};

} // namespace scriptbox
