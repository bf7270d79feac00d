/**
 * Unit tests for ExecutionMonitor
 *
 * Poll state machine, result caching and backend error mapping.
 */

#include <gtest/gtest.h>
#include "execution_monitor.h"
#include "sandbox_provisioner.h"
#include "fake_backend.h"

namespace scriptbox {
namespace {

class ExecutionMonitorTest : public ::testing::Test {
protected:
    std::string submit() {
        std::string script = "print('hi')";
        SubmitResult result = provisioner.submit(
            std::vector<uint8_t>(script.begin(), script.end()), "main.py");
        EXPECT_TRUE(result.ok());
        return result.session_id;
    }

    std::string handle_of(const std::string& id) {
        return registry.get(id)->backend_handle;
    }

    FakeBackend backend;
    SessionRegistry registry;
    SandboxProvisioner provisioner{backend, registry};
    ExecutionMonitor monitor{backend, registry};
};

// ============================================================================
// State transitions
// ============================================================================

TEST_F(ExecutionMonitorTest, RunningSessionReportsStillRunning) {
    std::string id = submit();

    PollResult result = monitor.poll(id);

    EXPECT_EQ(result.state, PollState::STILL_RUNNING);
    EXPECT_EQ(result.error, ErrorKind::NONE);
    EXPECT_EQ(backend.logs_calls, 0) << "Logs are only fetched once the script exited";
    EXPECT_EQ(registry.get(id)->status, SessionStatus::RUNNING);
}

TEST_F(ExecutionMonitorTest, FinishedSessionReturnsLogs) {
    std::string id = submit();
    backend.finish(handle_of(id), 0, "hi\n");

    PollResult result = monitor.poll(id);

    EXPECT_EQ(result.state, PollState::FINISHED);
    EXPECT_EQ(result.logs, "hi\n");
    EXPECT_EQ(result.exit_code.value_or(-1), 0);

    auto session = registry.get(id);
    EXPECT_EQ(session->status, SessionStatus::COMPLETED);
    EXPECT_EQ(session->cached_logs.value_or(""), "hi\n");
}

TEST_F(ExecutionMonitorTest, NonZeroExitIsExecutionFailure) {
    std::string id = submit();
    backend.finish(handle_of(id), 1, "Traceback (most recent call last):\nValueError\n");

    PollResult result = monitor.poll(id);

    EXPECT_EQ(result.state, PollState::FAILED);
    EXPECT_EQ(result.error, ErrorKind::EXECUTION_FAILED);
    EXPECT_EQ(result.exit_code.value_or(0), 1);
    EXPECT_NE(result.logs.find("ValueError"), std::string::npos);
    EXPECT_EQ(result.message, "exited with code 1");
    EXPECT_EQ(registry.get(id)->status, SessionStatus::FAILED);
}

TEST_F(ExecutionMonitorTest, FailureCarriesBackendDetail) {
    std::string id = submit();
    backend.finish(handle_of(id), 137, "", "memory limit exceeded");

    PollResult result = monitor.poll(id);

    EXPECT_EQ(result.state, PollState::FAILED);
    EXPECT_EQ(result.message, "memory limit exceeded");
    EXPECT_EQ(registry.get(id)->error, "memory limit exceeded");
}

TEST_F(ExecutionMonitorTest, PollRecordsActivity) {
    std::string id = submit();
    auto before = registry.get(id)->last_checked_at;

    monitor.poll(id);

    EXPECT_GE(registry.get(id)->last_checked_at, before);
}

// ============================================================================
// Idempotence once finished
// ============================================================================

TEST_F(ExecutionMonitorTest, RepeatedPollsUseCacheWithoutBackendQueries) {
    // Given: A finished session that has been polled once
    std::string id = submit();
    backend.finish(handle_of(id), 0, "hi\n");
    PollResult first = monitor.poll(id);
    int queries = backend.backend_queries();

    // When: Polled again several times
    for (int i = 0; i < 5; ++i) {
        PollResult again = monitor.poll(id);
        // Then: Identical results, no more backend traffic
        EXPECT_EQ(again.state, first.state);
        EXPECT_EQ(again.logs, first.logs);
        EXPECT_EQ(again.exit_code, first.exit_code);
    }
    EXPECT_EQ(backend.backend_queries(), queries);
}

TEST_F(ExecutionMonitorTest, CachedResultSurvivesEnvironmentLoss) {
    std::string id = submit();
    backend.finish(handle_of(id), 0, "hi\n");
    monitor.poll(id);

    backend.vanish(handle_of(id));

    PollResult result = monitor.poll(id);
    EXPECT_EQ(result.state, PollState::FINISHED);
    EXPECT_EQ(result.logs, "hi\n");
}

TEST_F(ExecutionMonitorTest, FailedResultIsCachedToo) {
    std::string id = submit();
    backend.finish(handle_of(id), 2, "boom");
    monitor.poll(id);
    int queries = backend.backend_queries();

    PollResult result = monitor.poll(id);
    EXPECT_EQ(result.state, PollState::FAILED);
    EXPECT_EQ(result.logs, "boom");
    EXPECT_EQ(backend.backend_queries(), queries);
}

TEST_F(ExecutionMonitorTest, SinglePollMakesAtMostOneStatusQuery) {
    std::string id = submit();
    backend.finish(handle_of(id), 0, "");

    monitor.poll(id);

    EXPECT_EQ(backend.status_calls, 1);
    EXPECT_EQ(backend.logs_calls, 1);
}

// ============================================================================
// Not found and faults
// ============================================================================

TEST_F(ExecutionMonitorTest, UnknownSessionIsNotFound) {
    PollResult result = monitor.poll("abc");
    EXPECT_EQ(result.state, PollState::NOT_FOUND);
    EXPECT_EQ(result.error, ErrorKind::NOT_FOUND);
    EXPECT_EQ(backend.status_calls, 0);
}

TEST_F(ExecutionMonitorTest, VanishedEnvironmentIsNotFound) {
    std::string id = submit();
    backend.vanish(handle_of(id));

    EXPECT_EQ(monitor.poll(id).state, PollState::NOT_FOUND);
}

TEST_F(ExecutionMonitorTest, StatusErrorIsRetrievalFault) {
    std::string id = submit();
    backend.status_error = BackendResult::failure(BackendErrorCode::TIMEOUT, "docker call timed out");

    PollResult result = monitor.poll(id);

    EXPECT_EQ(result.state, PollState::FAULT);
    EXPECT_EQ(result.error, ErrorKind::RETRIEVAL_FAULT);
    EXPECT_EQ(result.message, "docker call timed out");
    EXPECT_EQ(registry.get(id)->status, SessionStatus::RUNNING) << "A fault must not change state";
}

TEST_F(ExecutionMonitorTest, LogsErrorDoesNotCachePartialResult) {
    std::string id = submit();
    backend.finish(handle_of(id), 0, "hi\n");
    backend.logs_error = BackendResult::failure(BackendErrorCode::INTERNAL, "read failed");

    EXPECT_EQ(monitor.poll(id).state, PollState::FAULT);
    EXPECT_FALSE(registry.get(id)->cached_logs.has_value());

    // Recovers on the next poll
    backend.logs_error = BackendResult::success();
    PollResult result = monitor.poll(id);
    EXPECT_EQ(result.state, PollState::FINISHED);
    EXPECT_EQ(result.logs, "hi\n");
}

} // namespace
} // namespace scriptbox
