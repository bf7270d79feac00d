#include "docker_backend.h"
#include "file_utils.h"
#include <sstream>
#include <iostream>
#include <filesystem>

namespace scriptbox {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

DockerBackend::DockerBackend(const DockerBackendOptions& options, CommandRunner runner)
    : options_(options), runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = [](const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
            return Subprocess::run(argv, timeout);
        };
    }
}

CommandResult DockerBackend::docker(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {options_.docker.binary};
    if (!options_.docker.host.empty()) {
        argv.push_back("-H");
        argv.push_back(options_.docker.host);
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_(argv, std::chrono::duration_cast<std::chrono::milliseconds>(options_.call_timeout));
}

BackendResult DockerBackend::classify_failure(const CommandResult& result, const std::string& what) {
    if (result.timed_out) {
        return BackendResult::failure(BackendErrorCode::TIMEOUT, what + ": docker call timed out");
    }
    if (result.launch_failed) {
        return BackendResult::failure(BackendErrorCode::UNAVAILABLE, what + ": " + result.error_message);
    }

    std::string err = trim(result.stderr_output);
    if (err.find("No such container") != std::string::npos ||
        err.find("No such object") != std::string::npos ||
        err.find("is already in progress") != std::string::npos) {
        return BackendResult::failure(BackendErrorCode::NOT_FOUND, what + ": " + err);
    }
    if (err.find("Cannot connect to the Docker daemon") != std::string::npos ||
        err.find("Unable to find image") != std::string::npos ||
        err.find("error during connect") != std::string::npos ||
        err.find("no space left on device") != std::string::npos) {
        return BackendResult::failure(BackendErrorCode::UNAVAILABLE, what + ": " + err);
    }
    return BackendResult::failure(BackendErrorCode::INTERNAL,
        what + ": exit " + std::to_string(result.exit_code) + (err.empty() ? "" : ": " + err));
}

bool DockerBackend::parse_inspect(const std::string& output, StatusOutcome& outcome) {
    std::istringstream in(trim(output));
    std::string state;
    int exit_code = 0;
    std::string oom_killed;
    if (!(in >> state >> exit_code)) {
        return false;
    }
    in >> oom_killed;

    if (state == "created" || state == "running" || state == "restarting" || state == "paused") {
        outcome.state = EnvironmentState::RUNNING;
        outcome.detail = state;
        return true;
    }
    if (state == "exited" || state == "dead" || state == "removing") {
        outcome.state = EnvironmentState::EXITED;
        outcome.exit_code = exit_code;
        if (oom_killed == "true") {
            outcome.detail = "memory limit exceeded";
        } else {
            outcome.detail = "exited with code " + std::to_string(exit_code);
        }
        return true;
    }
    return false;
}

std::vector<std::string> DockerBackend::create_args(const LaunchSpec& spec) const {
    const ResourceLimits& limits = options_.limits;
    std::vector<std::string> args = {"create"};
    if (!limits.allow_network) {
        args.push_back("--network");
        args.push_back("none");
    }
    args.insert(args.end(), {
        "--memory", std::to_string(limits.memory_limit_mb) + "m",
        "--cpu-quota", std::to_string(limits.cpu_quota_us),
        "--cpu-period", std::to_string(limits.cpu_period_us),
        "--pids-limit", "64",
        "--ulimit", "nofile=" + std::to_string(limits.max_open_files),
        "--env", "PYTHONUNBUFFERED=1",
        "--label", "scriptbox.session=" + spec.session_id,
        "--workdir", DOCKER_CODE_DIR,
        options_.docker.image,
        "timeout", std::to_string(limits.wall_timeout.count()),
        options_.interpreter, std::string(DOCKER_CODE_DIR) + "/" + spec.entrypoint
    });
    return args;
}

ProvisionOutcome DockerBackend::provision(const LaunchSpec& spec) {
    ProvisionOutcome outcome;

    // Stage the script on the host for docker cp
    std::string staging;
    try {
        staging = options_.work_root + "/stage-" + FileUtils::random_uuid();
    } catch (const std::exception& e) {
        outcome.result = BackendResult::failure(BackendErrorCode::INTERNAL, e.what());
        return outcome;
    }
    std::string code_dir = staging + "/code";

    std::error_code ec;
    fs::create_directories(code_dir, ec);
    if (ec) {
        outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
            "cannot create staging directory: " + ec.message());
        return outcome;
    }

    auto discard_staging = [&staging]() {
        std::error_code ignored;
        fs::remove_all(staging, ignored);
    };

    if (!FileUtils::write_file(code_dir + "/" + spec.entrypoint, spec.content)) {
        discard_staging();
        outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE, "cannot stage script");
        return outcome;
    }

    CommandResult created = docker(create_args(spec));
    if (!created.ok()) {
        discard_staging();
        outcome.result = classify_failure(created, "docker create");
        if (outcome.result.not_found()) {
            outcome.result.code = BackendErrorCode::UNAVAILABLE;
        }
        return outcome;
    }
    std::string container_id = trim(created.stdout_output);

    // A half-built container must not outlive a failed provision
    auto abandon = [this, &container_id, &discard_staging](const CommandResult& failed,
                                                           const std::string& what) {
        discard_staging();
        BackendResult result = classify_failure(failed, what);
        CommandResult removed = docker({"rm", "-f", container_id});
        if (!removed.ok()) {
            std::cerr << "[DockerBackend] Leaked container " << container_id
                      << " after failed " << what << ": " << trim(removed.stderr_output) << std::endl;
        }
        if (result.not_found()) {
            result.code = BackendErrorCode::UNAVAILABLE;
        }
        return result;
    };

    CommandResult copied = docker({"cp", code_dir + "/.", container_id + ":" + DOCKER_CODE_DIR});
    if (!copied.ok()) {
        outcome.result = abandon(copied, "docker cp");
        return outcome;
    }
    discard_staging();

    CommandResult started = docker({"start", container_id});
    if (!started.ok()) {
        outcome.result = abandon(started, "docker start");
        return outcome;
    }

    outcome.handle = container_id;
    return outcome;
}

StatusOutcome DockerBackend::status(const std::string& handle) {
    StatusOutcome outcome;
    CommandResult inspected = docker({
        "inspect", "--format", "{{.State.Status}} {{.State.ExitCode}} {{.State.OOMKilled}}", handle
    });
    if (!inspected.ok()) {
        outcome.result = classify_failure(inspected, "docker inspect");
        return outcome;
    }
    if (!parse_inspect(inspected.stdout_output, outcome)) {
        outcome.result = BackendResult::failure(BackendErrorCode::INTERNAL,
            "unexpected docker inspect output: " + trim(inspected.stdout_output));
    }
    return outcome;
}

LogsOutcome DockerBackend::logs(const std::string& handle) {
    LogsOutcome outcome;
    CommandResult fetched = docker({"logs", handle});
    if (!fetched.ok()) {
        outcome.result = classify_failure(fetched, "docker logs");
        return outcome;
    }
    // The CLI splits the container's streams; stdout first, then stderr
    outcome.logs = fetched.stdout_output + fetched.stderr_output;
    if (outcome.logs.size() > options_.limits.max_output_bytes) {
        outcome.logs.resize(options_.limits.max_output_bytes);
    }
    return outcome;
}

BackendResult DockerBackend::stop(const std::string& handle) {
    CommandResult stopped = docker({"stop", "--time", std::to_string(options_.stop_grace.count()), handle});
    if (!stopped.ok()) {
        return classify_failure(stopped, "docker stop");
    }
    return BackendResult::success();
}

BackendResult DockerBackend::remove(const std::string& handle) {
    CommandResult removed = docker({"rm", "-f", handle});
    if (!removed.ok()) {
        return classify_failure(removed, "docker rm");
    }
    return BackendResult::success();
}

bool DockerBackend::daemon_reachable() {
    CommandResult version = docker({"version", "--format", "{{.Server.Version}}"});
    return version.ok();
}

} // namespace scriptbox
