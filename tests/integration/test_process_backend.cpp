/**
 * Integration tests for ProcessBackend
 *
 * These launch real interpreters, so they need python3 on PATH and are
 * skipped otherwise.
 */

#include <gtest/gtest.h>
#include "process_backend.h"
#include "subprocess.h"
#include "file_utils.h"
#include <filesystem>
#include <signal.h>
#include <cerrno>
#include <thread>

namespace scriptbox {
namespace {

using namespace std::chrono_literals;

bool python_available() {
    CommandResult check = Subprocess::run({"python3", "-c", "pass"}, 10000ms);
    return check.ok();
}

class ProcessBackendIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!python_available()) {
            GTEST_SKIP() << "python3 not available";
        }

        work_root = std::filesystem::temp_directory_path() / "scriptbox_process_integration";
        std::filesystem::create_directories(work_root);

        options.work_root = work_root.string();
        options.limits.memory_limit_mb = 512;
        options.limits.wall_timeout = 10s;
        options.stop_grace = 1s;
        backend = std::make_unique<ProcessBackend>(options);
    }

    void TearDown() override {
        backend.reset();
        std::error_code ec;
        std::filesystem::remove_all(work_root, ec);
    }

    LaunchSpec script(const std::string& code) {
        LaunchSpec spec;
        spec.session_id = "it-session";
        spec.entrypoint = "main.py";
        spec.content.assign(code.begin(), code.end());
        return spec;
    }

    std::string launch(const std::string& code) {
        ProvisionOutcome outcome = backend->provision(script(code));
        EXPECT_TRUE(outcome.result.ok()) << outcome.result.message;
        return outcome.handle;
    }

    // Polls status until the environment exits or the deadline passes
    StatusOutcome wait_for_exit(const std::string& handle,
                                std::chrono::seconds limit = 15s) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        StatusOutcome outcome;
        while (std::chrono::steady_clock::now() < deadline) {
            outcome = backend->status(handle);
            if (!outcome.result.ok() || outcome.state == EnvironmentState::EXITED) {
                return outcome;
            }
            std::this_thread::sleep_for(50ms);
        }
        return outcome;
    }

    std::filesystem::path work_root;
    ProcessBackendOptions options;
    std::unique_ptr<ProcessBackend> backend;
};

TEST_F(ProcessBackendIntegrationTest, PrintReachesLogs) {
    std::string handle = launch("print(\"hi\")\n");
    ASSERT_FALSE(handle.empty());

    StatusOutcome status = wait_for_exit(handle);
    ASSERT_TRUE(status.result.ok()) << status.result.message;
    EXPECT_EQ(status.state, EnvironmentState::EXITED);
    EXPECT_EQ(status.exit_code, 0);

    LogsOutcome logs = backend->logs(handle);
    ASSERT_TRUE(logs.result.ok());
    EXPECT_EQ(logs.logs, "hi\n");
}

TEST_F(ProcessBackendIntegrationTest, StderrIsCapturedWithStdout) {
    std::string handle = launch("import sys\nprint('out')\nsys.stderr.write('err\\n')\n");

    ASSERT_EQ(wait_for_exit(handle).state, EnvironmentState::EXITED);

    LogsOutcome logs = backend->logs(handle);
    EXPECT_NE(logs.logs.find("out"), std::string::npos);
    EXPECT_NE(logs.logs.find("err"), std::string::npos);
}

TEST_F(ProcessBackendIntegrationTest, NonZeroExitIsReported) {
    std::string handle = launch("import sys\nprint('partial')\nsys.exit(3)\n");

    StatusOutcome status = wait_for_exit(handle);
    ASSERT_EQ(status.state, EnvironmentState::EXITED);
    EXPECT_EQ(status.exit_code, 3);
    EXPECT_EQ(status.detail, "exited with code 3");
    EXPECT_EQ(backend->logs(handle).logs, "partial\n");
}

TEST_F(ProcessBackendIntegrationTest, UncaughtExceptionFails) {
    std::string handle = launch("raise ValueError('boom')\n");

    StatusOutcome status = wait_for_exit(handle);
    ASSERT_EQ(status.state, EnvironmentState::EXITED);
    EXPECT_NE(status.exit_code, 0);
    EXPECT_NE(backend->logs(handle).logs.find("ValueError: boom"), std::string::npos);
}

TEST_F(ProcessBackendIntegrationTest, StatusDoesNotBlockWhileRunning) {
    std::string handle = launch("import time\ntime.sleep(5)\n");

    auto start = std::chrono::steady_clock::now();
    StatusOutcome status = backend->status(handle);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(status.result.ok());
    EXPECT_EQ(status.state, EnvironmentState::RUNNING);
    EXPECT_LT(elapsed, 1s);
}

TEST_F(ProcessBackendIntegrationTest, WallTimeoutKillsScript) {
    options.limits.wall_timeout = 1s;
    backend = std::make_unique<ProcessBackend>(options);

    std::string handle = launch("import time\ntime.sleep(30)\n");

    StatusOutcome status = wait_for_exit(handle, 10s);
    ASSERT_EQ(status.state, EnvironmentState::EXITED);
    EXPECT_NE(status.exit_code, 0);
    EXPECT_EQ(status.detail, "wall clock limit exceeded");
}

TEST_F(ProcessBackendIntegrationTest, NetworkIsDeniedByDefault) {
    std::string handle = launch(
        "import socket\n"
        "try:\n"
        "    socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "    print('open')\n"
        "except OSError:\n"
        "    print('denied')\n");

    ASSERT_EQ(wait_for_exit(handle).state, EnvironmentState::EXITED);
    EXPECT_EQ(backend->logs(handle).logs, "denied\n");
}

TEST_F(ProcessBackendIntegrationTest, ScriptRunsInsideItsCodeDirectory) {
    std::string handle = launch("import os\nprint(sorted(os.listdir('.')))\n");

    ASSERT_EQ(wait_for_exit(handle).state, EnvironmentState::EXITED);
    EXPECT_EQ(backend->logs(handle).logs, "['main.py']\n");
}

TEST_F(ProcessBackendIntegrationTest, StopTerminatesRunningScript) {
    std::string handle = launch("import time\ntime.sleep(60)\n");

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(backend->stop(handle).ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    StatusOutcome status = backend->status(handle);
    ASSERT_TRUE(status.result.ok());
    EXPECT_EQ(status.state, EnvironmentState::EXITED);
}

TEST_F(ProcessBackendIntegrationTest, RemoveDeletesEnvironment) {
    std::string handle = launch("print('x')\n");
    std::string dir = backend->environment_path(handle);
    ASSERT_FALSE(dir.empty());
    EXPECT_TRUE(std::filesystem::exists(dir));

    ASSERT_TRUE(backend->remove(handle).ok());

    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_TRUE(backend->status(handle).result.not_found());
    EXPECT_TRUE(backend->logs(handle).result.not_found());
    EXPECT_TRUE(backend->remove(handle).not_found());
}

TEST_F(ProcessBackendIntegrationTest, FinishedLeaderHoldsItsGroupUntilRemoved) {
    // Given: A script that has exited and been observed by status()
    std::string handle = launch("print('done')\n");
    ASSERT_EQ(wait_for_exit(handle).state, EnvironmentState::EXITED);
    pid_t leader = backend->leader_pid(handle);
    ASSERT_GT(leader, 0);

    // Then: The leader is still unreaped, so its pid cannot be recycled
    // into another session's process group
    EXPECT_EQ(kill(leader, 0), 0);
    EXPECT_EQ(backend->status(handle).exit_code, 0);

    // When: Removed, the leader is collected
    ASSERT_TRUE(backend->remove(handle).ok());
    EXPECT_EQ(kill(leader, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(ProcessBackendIntegrationTest, RemovingFinishedSessionLeavesOthersRunning) {
    std::string finished = launch("print('a')\n");
    ASSERT_EQ(wait_for_exit(finished).state, EnvironmentState::EXITED);

    std::string running = launch("import time\ntime.sleep(30)\n");
    ASSERT_FALSE(running.empty());

    ASSERT_TRUE(backend->remove(finished).ok());

    StatusOutcome status = backend->status(running);
    ASSERT_TRUE(status.result.ok());
    EXPECT_EQ(status.state, EnvironmentState::RUNNING);
}

TEST_F(ProcessBackendIntegrationTest, RemoveKillsBackgroundChildren) {
    // The leader exits while a child it started keeps running in the group
    std::string handle = launch(
        "import subprocess\n"
        "p = subprocess.Popen(['sleep', '30'])\n"
        "print(p.pid)\n");
    ASSERT_EQ(wait_for_exit(handle).state, EnvironmentState::EXITED);

    pid_t child = static_cast<pid_t>(std::stol(backend->logs(handle).logs));
    ASSERT_GT(child, 0);
    EXPECT_EQ(kill(child, 0), 0);

    ASSERT_TRUE(backend->remove(handle).ok());

    // Killed, then reparented and collected by whoever reaps orphans
    auto deadline = std::chrono::steady_clock::now() + 5s;
    bool gone = false;
    while (std::chrono::steady_clock::now() < deadline) {
        std::string state;
        if (!FileUtils::read_file("/proc/" + std::to_string(child) + "/stat", 4096, state)) {
            gone = true;
            break;
        }
        // Field 3 is the state; a zombie awaiting its new parent counts as dead
        size_t close_paren = state.rfind(')');
        if (close_paren != std::string::npos && close_paren + 2 < state.size() &&
            state[close_paren + 2] == 'Z') {
            gone = true;
            break;
        }
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_TRUE(gone);
}

TEST_F(ProcessBackendIntegrationTest, DestroyIsIdempotent) {
    std::string handle = launch("import time\ntime.sleep(60)\n");

    EXPECT_TRUE(backend->destroy(handle).ok());
    EXPECT_TRUE(backend->destroy(handle).ok());
    EXPECT_TRUE(std::filesystem::is_empty(work_root));
}

TEST_F(ProcessBackendIntegrationTest, MissingInterpreterFailsProvisioning) {
    options.interpreter = "scriptbox-no-such-interpreter";
    backend = std::make_unique<ProcessBackend>(options);

    ProvisionOutcome outcome = backend->provision(script("print(1)\n"));

    EXPECT_FALSE(outcome.result.ok());
    EXPECT_EQ(outcome.result.code, BackendErrorCode::UNAVAILABLE);
    EXPECT_TRUE(outcome.handle.empty());
    EXPECT_TRUE(std::filesystem::is_empty(work_root)) << "Failed launch leaves no staging behind";
}

} // namespace
} // namespace scriptbox
