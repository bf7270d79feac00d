#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdint>
#include <mutex>
#include <condition_variable>
#include "config.h"
#include "session.h"
#include "isolation_backend.h"
#include "session_registry.h"
#include "sandbox_provisioner.h"
#include "execution_monitor.h"
#include "cleanup_coordinator.h"

namespace scriptbox {

// Point-in-time view for /stats
struct ServiceStats {
    std::string backend;
    size_t live_sessions = 0;
    std::map<SessionStatus, size_t> by_status;
    CleanupCoordinator::Stats cleanup;
    std::vector<TeardownFault> recent_faults;
};

// Owns the lifecycle core: one backend, the registry and the three
// components that operate on it.
class ExecutionService {
public:
    // Builds the backend named by config.backend
    explicit ExecutionService(const ServiceConfig& config);

    // Uses a caller-supplied backend (tests, embedding)
    ExecutionService(const ServiceConfig& config, std::unique_ptr<IsolationBackend> backend);

    ~ExecutionService();

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    SubmitResult submit(const std::vector<uint8_t>& artifact, const std::string& filename);
    PollResult poll(const std::string& session_id);
    CleanupResult cleanup(const std::string& session_id);

    void start_reaper();

    // Refuse new submissions, wait for those already provisioning, stop
    // the reaper and tear down every remaining session
    size_t shutdown();

    bool closed();

    ServiceStats stats();

    const ServiceConfig& config() const { return config_; }
    IsolationBackend& backend() { return *backend_; }
    SessionRegistry& registry() { return registry_; }
    CleanupCoordinator& coordinator() { return coordinator_; }

    static std::unique_ptr<IsolationBackend> make_backend(const ServiceConfig& config);

private:
    ServiceConfig config_;
    std::unique_ptr<IsolationBackend> backend_;
    SessionRegistry registry_;
    SandboxProvisioner provisioner_;
    ExecutionMonitor monitor_;
    CleanupCoordinator coordinator_;

    std::mutex lifecycle_mutex_;
    std::condition_variable submits_drained_;
    bool closed_ = false;
    size_t submits_in_flight_ = 0;
};

} // namespace scriptbox
