#pragma once

#include <string>
#include <optional>
#include "errors.h"
#include "isolation_backend.h"
#include "session_registry.h"

namespace scriptbox {

enum class PollState {
    STILL_RUNNING,
    FINISHED,       // Exit code 0, logs attached
    FAILED,         // Abnormal termination, logs and reason attached
    NOT_FOUND,
    FAULT           // Backend error while retrieving; nothing was cached
};

struct PollResult {
    PollState state = PollState::NOT_FOUND;
    ErrorKind error = ErrorKind::NONE;
    std::string logs;
    std::string message;
    std::optional<int> exit_code;
};

// Non-blocking status and output retrieval. Each call makes at most one
// status query and one log fetch against the backend, and none at all once
// the output has been cached.
class ExecutionMonitor {
public:
    ExecutionMonitor(IsolationBackend& backend, SessionRegistry& registry);

    PollResult poll(const std::string& session_id);

private:
    static PollResult from_cache(const Session& session);

    IsolationBackend& backend_;
    SessionRegistry& registry_;
};

} // namespace scriptbox
