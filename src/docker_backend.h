#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include "isolation_backend.h"
#include "subprocess.h"
#include "config.h"

namespace scriptbox {

struct DockerBackendOptions {
    DockerConfig docker;
    std::string work_root = DEFAULT_WORK_ROOT;      // Host staging for docker cp
    std::string interpreter = "python";             // Inside the image
    ResourceLimits limits;
    std::chrono::seconds call_timeout{DEFAULT_BACKEND_CALL_TIMEOUT_SECONDS};
    std::chrono::seconds stop_grace{DEFAULT_STOP_GRACE_SECONDS};
};

// Drives the docker CLI. Each environment is one container:
//
//   docker create --network none --memory ... -w /code IMAGE python /code/ENTRY
//   docker cp <staging>/code/. CONTAINER:/code
//   docker start CONTAINER
//
// Every CLI call runs with the configured timeout so a wedged daemon
// surfaces as TIMEOUT instead of holding the caller.
class DockerBackend : public IsolationBackend {
public:
    using CommandRunner = std::function<CommandResult(const std::vector<std::string>&,
                                                      std::chrono::milliseconds)>;

    explicit DockerBackend(const DockerBackendOptions& options,
                           CommandRunner runner = nullptr);

    ProvisionOutcome provision(const LaunchSpec& spec) override;
    StatusOutcome status(const std::string& handle) override;
    LogsOutcome logs(const std::string& handle) override;
    BackendResult stop(const std::string& handle) override;
    BackendResult remove(const std::string& handle) override;
    std::string name() const override { return "docker"; }

    // True if `docker version` answers within the call timeout
    bool daemon_reachable();

    // Arguments for `docker create` (without the binary and -H prefix)
    std::vector<std::string> create_args(const LaunchSpec& spec) const;

    // Map a failed CLI call onto a backend error
    static BackendResult classify_failure(const CommandResult& result, const std::string& what);

    // Parse "<status> <exit code> <oom killed>" from docker inspect
    static bool parse_inspect(const std::string& output, StatusOutcome& outcome);

private:
    CommandResult docker(const std::vector<std::string>& args);

    DockerBackendOptions options_;
    CommandRunner runner_;
};

} // namespace scriptbox
