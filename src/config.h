#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include "constants.h"

namespace scriptbox {

// What an upload must look like to be accepted
struct ArtifactPolicy {
    size_t max_bytes = DEFAULT_MAX_ARTIFACT_BYTES;
    std::vector<std::string> allowed_extensions = {DEFAULT_ALLOWED_EXTENSION};  // Empty = any
    std::string entrypoint = DEFAULT_ENTRYPOINT;
};

// Limits applied to every isolated environment
struct ResourceLimits {
    size_t memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
    size_t cpu_quota_us = DEFAULT_CPU_QUOTA_US;
    size_t cpu_period_us = DEFAULT_CPU_PERIOD_US;
    std::chrono::seconds wall_timeout{DEFAULT_WALL_TIMEOUT_SECONDS};
    size_t max_output_bytes = MAX_OUTPUT_SIZE;
    size_t max_file_size_mb = MAX_FILE_SIZE_MB;
    int max_open_files = MAX_OPEN_FILES;
    bool allow_network = false;                      // Airgapped by default
};

struct ReaperConfig {
    std::chrono::seconds max_age{DEFAULT_SESSION_MAX_AGE_SECONDS};
    std::chrono::seconds idle_timeout{DEFAULT_SESSION_IDLE_SECONDS};  // 0 disables
    std::chrono::seconds interval{DEFAULT_REAP_INTERVAL_SECONDS};
};

enum class BackendKind {
    PROCESS,
    DOCKER
};

struct DockerConfig {
    std::string binary = DEFAULT_DOCKER_BINARY;
    std::string host;                                // -H endpoint; empty = local daemon
    std::string image = DEFAULT_DOCKER_IMAGE;
};

struct ServiceConfig {
    int port = DEFAULT_PORT;
    BackendKind backend = BackendKind::PROCESS;
    std::string work_root = DEFAULT_WORK_ROOT;       // Staging area on the host
    std::string interpreter = DEFAULT_INTERPRETER;
    std::chrono::seconds backend_call_timeout{DEFAULT_BACKEND_CALL_TIMEOUT_SECONDS};
    std::chrono::seconds stop_grace{DEFAULT_STOP_GRACE_SECONDS};

    ArtifactPolicy artifact;
    ResourceLimits limits;
    ReaperConfig reaper;
    DockerConfig docker;

    bool show_help = false;

    // Environment lookup, replaceable for tests
    using EnvLookup = std::function<const char*(const char*)>;

    // Apply SCRIPTBOX_* / DOCKER_HOST variables. Throws std::invalid_argument.
    void apply_environment(const EnvLookup& getenv_fn);

    // Apply command-line flags. Throws std::invalid_argument.
    void apply_args(int argc, const char* const argv[]);

    // Defaults, then environment, then flags
    static ServiceConfig load(int argc, const char* const argv[]);

    static std::string usage(const std::string& program);
};

BackendKind parse_backend_kind(const std::string& value);
const char* to_string(BackendKind kind);

} // namespace scriptbox
