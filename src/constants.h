#pragma once

#include <cstddef>  // for size_t

namespace scriptbox {

// Artifact policy
constexpr size_t DEFAULT_MAX_ARTIFACT_BYTES = 1024 * 1024;       // 1MB per script
constexpr const char* DEFAULT_ENTRYPOINT = "main.py";            // Name inside the environment
constexpr const char* DEFAULT_ALLOWED_EXTENSION = ".py";
constexpr const char* DEFAULT_INTERPRETER = "python3";

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_MB = 256;                  // Per environment
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;             // 10MB max captured output
constexpr size_t MAX_REQUEST_SIZE = 16 * 1024 * 1024;            // 16MB max request
constexpr size_t MAX_FILE_SIZE_MB = 16;                          // Files written by the script

// CPU and time limits
constexpr size_t DEFAULT_CPU_QUOTA_US = 50 * 1000;               // Half a CPU...
constexpr size_t DEFAULT_CPU_PERIOD_US = 100 * 1000;             // ...per 100ms period
constexpr int DEFAULT_WALL_TIMEOUT_SECONDS = 60;                 // Hard stop for one script
constexpr int DEFAULT_BACKEND_CALL_TIMEOUT_SECONDS = 10;         // Bound on one substrate call
constexpr int DEFAULT_STOP_GRACE_SECONDS = 2;                    // SIGTERM -> SIGKILL

// Session reclamation
constexpr int DEFAULT_SESSION_MAX_AGE_SECONDS = 300;             // Reap 5 minutes after creation
constexpr int DEFAULT_SESSION_IDLE_SECONDS = 120;                // ...or 2 minutes without a poll
constexpr int DEFAULT_REAP_INTERVAL_SECONDS = 5;                 // Reaper scan period
constexpr size_t MAX_RECORDED_FAULTS = 64;                       // Teardown fault ring size

// Process limits
constexpr int MAX_OPEN_FILES = 64;                               // Max file descriptors

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 5000;                               // Default server port
constexpr int LISTEN_BACKLOG = 16;                               // Socket listen backlog
constexpr int CLIENT_READ_TIMEOUT_SECONDS = 30;                  // Idle client before the connection is dropped

// Docker
constexpr const char* DEFAULT_DOCKER_BINARY = "docker";
constexpr const char* DEFAULT_DOCKER_IMAGE = "python:3.9-slim";
constexpr const char* DOCKER_CODE_DIR = "/code";

// Filesystem
constexpr const char* DEFAULT_WORK_ROOT = "/tmp/scriptbox";

} // namespace scriptbox
