#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "errors.h"

namespace scriptbox {

// What to stage into a fresh environment
struct LaunchSpec {
    std::string session_id;                // Used for naming/labels only
    std::string entrypoint;                // File name at the well-known code path
    std::vector<uint8_t> content;          // Script bytes
};

enum class EnvironmentState {
    RUNNING,
    EXITED
};

struct ProvisionOutcome {
    BackendResult result;
    std::string handle;
};

struct StatusOutcome {
    BackendResult result;
    EnvironmentState state = EnvironmentState::RUNNING;
    int exit_code = 0;                     // Valid when EXITED; 128+signo on signal death
    std::string detail;                    // Backend's own wording (e.g. "OOMKilled")
};

struct LogsOutcome {
    BackendResult result;
    std::string logs;
};

// Narrow capability over the isolation substrate. Every call has bounded
// latency and reports a vanished environment as NOT_FOUND instead of hanging.
// Implementations must be safe to call from several threads at once.
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    // Create an environment, copy the script in and start it asynchronously
    virtual ProvisionOutcome provision(const LaunchSpec& spec) = 0;

    virtual StatusOutcome status(const std::string& handle) = 0;

    // Full captured output (stdout and stderr interleaved)
    virtual LogsOutcome logs(const std::string& handle) = 0;

    // Stop execution; succeeds if the environment has already exited
    virtual BackendResult stop(const std::string& handle) = 0;

    // Release the environment; NOT_FOUND if already gone
    virtual BackendResult remove(const std::string& handle) = 0;

    virtual std::string name() const = 0;

    // stop + remove, tolerating "already stopped" and "already removed"
    BackendResult destroy(const std::string& handle) {
        BackendResult stopped = stop(handle);
        if (!stopped.ok() && !stopped.not_found()) {
            // Still try to release it; remove is forceful
            BackendResult removed = remove(handle);
            if (removed.ok() || removed.not_found()) {
                return BackendResult::success();
            }
            return stopped;
        }
        BackendResult removed = remove(handle);
        if (removed.not_found()) {
            return BackendResult::success();
        }
        return removed;
    }
};

} // namespace scriptbox
