#include "cleanup_coordinator.h"
#include "constants.h"
#include <iostream>

namespace scriptbox {

CleanupCoordinator::CleanupCoordinator(IsolationBackend& backend, SessionRegistry& registry,
                                       const ReaperConfig& config)
    : backend_(backend), registry_(registry), config_(config) {}

CleanupCoordinator::~CleanupCoordinator() {
    stop_reaper();
}

CleanupResult CleanupCoordinator::teardown(const std::string& session_id, bool reaped) {
    CleanupResult result;

    std::optional<Session> session = registry_.remove(session_id);
    if (!session) {
        result.error = ErrorKind::NOT_FOUND;
        result.message = "Session not found";
        return result;
    }
    session->status = SessionStatus::CLEANED_UP;

    BackendResult destroyed = backend_.destroy(session->backend_handle);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (reaped) {
        stats_.reaped++;
    } else {
        stats_.cleaned++;
    }

    if (!destroyed.ok()) {
        result.teardown_fault = true;
        result.message = destroyed.message;
        stats_.teardown_faults++;

        TeardownFault fault;
        fault.session_id = session_id;
        fault.backend_handle = session->backend_handle;
        fault.message = destroyed.message;
        fault.reaped = reaped;
        fault.at = std::chrono::system_clock::now();
        faults_.push_back(std::move(fault));
        while (faults_.size() > MAX_RECORDED_FAULTS) {
            faults_.pop_front();
        }

        std::cerr << "[Cleanup] Teardown fault for session " << session_id
                  << " (handle " << session->backend_handle << ", "
                  << to_string(destroyed.code) << "): " << destroyed.message << std::endl;
    }
    return result;
}

CleanupResult CleanupCoordinator::cleanup(const std::string& session_id) {
    CleanupResult result = teardown(session_id, false);
    if (result.ok()) {
        std::cout << "[Cleanup] Session " << session_id << " cleaned up" << std::endl;
    }
    return result;
}

size_t CleanupCoordinator::reap_expired(std::chrono::steady_clock::time_point now) {
    std::optional<std::chrono::steady_clock::time_point> idle_cutoff;
    if (config_.idle_timeout.count() > 0) {
        idle_cutoff = now - config_.idle_timeout;
    }

    std::vector<std::string> expired = registry_.expired(now - config_.max_age, idle_cutoff);

    size_t reclaimed = 0;
    for (const auto& session_id : expired) {
        // A concurrent cleanup may have won; that is fine
        if (teardown(session_id, true).ok()) {
            std::cout << "[Reaper] Reclaimed expired session " << session_id << std::endl;
            reclaimed++;
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.reaper_passes++;
    return reclaimed;
}

size_t CleanupCoordinator::cleanup_all() {
    size_t reclaimed = 0;
    for (const auto& session_id : registry_.ids()) {
        if (teardown(session_id, false).ok()) {
            reclaimed++;
        }
    }
    if (reclaimed > 0) {
        std::cout << "[Cleanup] Tore down " << reclaimed << " remaining sessions" << std::endl;
    }
    return reclaimed;
}

void CleanupCoordinator::start_reaper() {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    if (reaper_.joinable()) {
        return;
    }
    stop_requested_ = false;
    reaper_running_ = true;
    reaper_ = std::thread([this]() { reaper_loop(); });
}

void CleanupCoordinator::stop_reaper() {
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        stop_requested_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable()) {
        reaper_.join();
    }
    reaper_running_ = false;
}

void CleanupCoordinator::reaper_loop() {
    std::cout << "[Reaper] Started (max age " << config_.max_age.count() << "s, idle "
              << config_.idle_timeout.count() << "s, every " << config_.interval.count() << "s)"
              << std::endl;

    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!stop_requested_) {
        if (reaper_cv_.wait_for(lock, config_.interval, [this]() { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            reap_expired(std::chrono::steady_clock::now());
        } catch (const std::exception& e) {
            // Keep reaping; one bad pass must not leak every later session
            std::cerr << "[Reaper] Pass failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

CleanupCoordinator::Stats CleanupCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::vector<TeardownFault> CleanupCoordinator::recent_faults() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return std::vector<TeardownFault>(faults_.begin(), faults_.end());
}

} // namespace scriptbox
