#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include "errors.h"
#include "config.h"
#include "isolation_backend.h"
#include "session_registry.h"

namespace scriptbox {

struct CleanupResult {
    ErrorKind error = ErrorKind::NONE;     // NONE (acknowledged) or NOT_FOUND
    bool teardown_fault = false;           // Backend destroy failed; recorded, not propagated
    std::string message;

    bool ok() const { return error == ErrorKind::NONE; }
};

// A backend resource that may have leaked
struct TeardownFault {
    std::string session_id;
    std::string backend_handle;
    std::string message;
    bool reaped = false;                   // Raised by the reaper rather than a request
    std::chrono::system_clock::time_point at;
};

// Tears down sessions on request and reclaims abandoned ones in the
// background. The registry entry is always removed first, so a session can
// never be stuck from the caller's view even if the backend misbehaves.
class CleanupCoordinator {
public:
    struct Stats {
        size_t cleaned = 0;                // Explicit cleanup requests acknowledged
        size_t reaped = 0;                 // Removed by age or idleness
        size_t teardown_faults = 0;
        size_t reaper_passes = 0;
    };

    CleanupCoordinator(IsolationBackend& backend, SessionRegistry& registry,
                       const ReaperConfig& config = ReaperConfig{});
    ~CleanupCoordinator();

    CleanupCoordinator(const CleanupCoordinator&) = delete;
    CleanupCoordinator& operator=(const CleanupCoordinator&) = delete;

    CleanupResult cleanup(const std::string& session_id);

    // One reaper pass as of `now`; returns the number of sessions reclaimed
    size_t reap_expired(std::chrono::steady_clock::time_point now);

    // Tear down every live session (shutdown)
    size_t cleanup_all();

    void start_reaper();
    void stop_reaper();
    bool reaper_running() const { return reaper_running_; }

    Stats stats() const;
    std::vector<TeardownFault> recent_faults() const;

private:
    CleanupResult teardown(const std::string& session_id, bool reaped);
    void reaper_loop();

    IsolationBackend& backend_;
    SessionRegistry& registry_;
    ReaperConfig config_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
    std::deque<TeardownFault> faults_;

    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> reaper_running_{false};
    std::thread reaper_;
};

} // namespace scriptbox
