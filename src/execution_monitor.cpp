#include "execution_monitor.h"
#include <iostream>

namespace scriptbox {

namespace {

PollResult not_found(const std::string& message) {
    PollResult result;
    result.state = PollState::NOT_FOUND;
    result.error = ErrorKind::NOT_FOUND;
    result.message = message;
    return result;
}

PollResult fault(const std::string& message) {
    PollResult result;
    result.state = PollState::FAULT;
    result.error = ErrorKind::RETRIEVAL_FAULT;
    result.message = message;
    return result;
}

} // namespace

ExecutionMonitor::ExecutionMonitor(IsolationBackend& backend, SessionRegistry& registry)
    : backend_(backend), registry_(registry) {}

PollResult ExecutionMonitor::from_cache(const Session& session) {
    PollResult result;
    result.logs = *session.cached_logs;
    result.exit_code = session.exit_code;
    if (session.status == SessionStatus::FAILED) {
        result.state = PollState::FAILED;
        result.error = ErrorKind::EXECUTION_FAILED;
        result.message = session.error;
    } else {
        result.state = PollState::FINISHED;
    }
    return result;
}

PollResult ExecutionMonitor::poll(const std::string& session_id) {
    // Held until return: a concurrent cleanup of this id waits for us
    SessionRegistry::Lease session = registry_.acquire(session_id);
    if (!session) {
        return not_found("Session not found");
    }

    session->last_checked_at = std::chrono::steady_clock::now();

    if (session->cached_logs) {
        return from_cache(*session);
    }
    if (session->status == SessionStatus::CLEANED_UP) {
        return not_found("Session not found");
    }

    StatusOutcome live = backend_.status(session->backend_handle);
    if (!live.result.ok()) {
        if (live.result.not_found()) {
            std::cerr << "[Monitor] Environment for " << session_id << " is gone: "
                      << live.result.message << std::endl;
            return not_found("Session not found");
        }
        std::cerr << "[Monitor] Status query failed for " << session_id << ": "
                  << live.result.message << std::endl;
        return fault(live.result.message);
    }

    if (live.state == EnvironmentState::RUNNING) {
        PollResult result;
        result.state = PollState::STILL_RUNNING;
        return result;
    }

    LogsOutcome output = backend_.logs(session->backend_handle);
    if (!output.result.ok()) {
        if (output.result.not_found()) {
            return not_found("Session not found");
        }
        std::cerr << "[Monitor] Log fetch failed for " << session_id << ": "
                  << output.result.message << std::endl;
        return fault(output.result.message);
    }

    session->cached_logs = std::move(output.logs);
    session->exit_code = live.exit_code;
    session->finished_at = std::chrono::steady_clock::now();
    if (live.exit_code == 0) {
        session->status = SessionStatus::COMPLETED;
    } else {
        session->status = SessionStatus::FAILED;
        session->error = live.detail.empty()
            ? "exited with code " + std::to_string(live.exit_code)
            : live.detail;
    }

    std::cout << "[Monitor] Session " << session_id << " " << to_string(session->status)
              << " (exit=" << live.exit_code << ", "
              << session->cached_logs->size() << " bytes of output)" << std::endl;

    return from_cache(*session);
}

} // namespace scriptbox
