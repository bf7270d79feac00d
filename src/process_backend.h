#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <sys/types.h>
#include "isolation_backend.h"
#include "config.h"

namespace scriptbox {

struct ProcessBackendOptions {
    std::string work_root = DEFAULT_WORK_ROOT;
    std::string interpreter = DEFAULT_INTERPRETER;
    ResourceLimits limits;
    std::chrono::seconds stop_grace{DEFAULT_STOP_GRACE_SECONDS};
    bool use_namespaces = true;   // Network/IPC/UTS namespaces when permitted
    bool use_seccomp = true;      // Syscall deny-list; provisioning fails if it cannot load
};

// Runs each script as a child process in its own process group and
// staging directory:
//
//   <work_root>/<handle>/code/<entrypoint>   the uploaded script
//   <work_root>/<handle>/output.log          stdout + stderr
//
// Nothing here waits for the script: status() reaps with WNOHANG.
class ProcessBackend : public IsolationBackend {
public:
    explicit ProcessBackend(const ProcessBackendOptions& options = ProcessBackendOptions{});
    ~ProcessBackend() override;

    ProvisionOutcome provision(const LaunchSpec& spec) override;
    StatusOutcome status(const std::string& handle) override;
    LogsOutcome logs(const std::string& handle) override;
    BackendResult stop(const std::string& handle) override;
    BackendResult remove(const std::string& handle) override;
    std::string name() const override { return "process"; }

    // True if children get private network/IPC/UTS namespaces
    bool namespaces_available() const;

    // Process group leader of an environment (-1 if unknown). Stays a
    // zombie after exit until remove(), so the id is not reused meanwhile.
    pid_t leader_pid(const std::string& handle) const;

    // Directory backing an environment ("" if unknown)
    std::string environment_path(const std::string& handle) const;

    // Probe whether this process may create namespaces
    static bool test_namespace_support();

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace scriptbox
