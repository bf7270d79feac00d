#include "config.h"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace scriptbox {

namespace {

long parse_number(const std::string& flag, const std::string& value, long min_value) {
    size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": expected a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + ": expected a number, got '" + value + "'");
    }
    if (parsed < min_value) {
        throw std::invalid_argument(flag + ": must be at least " + std::to_string(min_value));
    }
    return parsed;
}

int parse_port(const std::string& flag, const std::string& value) {
    long port = parse_number(flag, value, 1);
    if (port > 65535) {
        throw std::invalid_argument(flag + ": must be at most 65535");
    }
    return static_cast<int>(port);
}

// The entrypoint becomes a file name inside the environment
std::string parse_entrypoint(const std::string& flag, const std::string& value) {
    if (value.empty() || value == "." || value == ".." ||
        value.find('/') != std::string::npos || value.find('\0') != std::string::npos) {
        throw std::invalid_argument(flag + ": must be a plain file name, got '" + value + "'");
    }
    return value;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) continue;
        if (item[0] != '.') item = "." + item;
        items.push_back(item);
    }
    return items;
}

} // namespace

BackendKind parse_backend_kind(const std::string& value) {
    if (value == "process") return BackendKind::PROCESS;
    if (value == "docker") return BackendKind::DOCKER;
    throw std::invalid_argument("backend: unknown kind '" + value + "' (expected process or docker)");
}

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::PROCESS: return "process";
        case BackendKind::DOCKER: return "docker";
    }
    return "unknown";
}

void ServiceConfig::apply_environment(const EnvLookup& getenv_fn) {
    auto get = [&getenv_fn](const char* name) -> std::string {
        const char* value = getenv_fn(name);
        return value ? std::string(value) : std::string();
    };

    std::string value;
    if (!(value = get("SCRIPTBOX_PORT")).empty()) {
        port = parse_port("SCRIPTBOX_PORT", value);
    }
    if (!(value = get("SCRIPTBOX_BACKEND")).empty()) {
        backend = parse_backend_kind(value);
    }
    if (!(value = get("DOCKER_HOST")).empty()) {
        docker.host = value;
    }
    if (!(value = get("SCRIPTBOX_IMAGE")).empty()) {
        docker.image = value;
    }
    if (!(value = get("SCRIPTBOX_WORK_ROOT")).empty()) {
        work_root = value;
    }
    if (!(value = get("SCRIPTBOX_SESSION_MAX_AGE")).empty()) {
        reaper.max_age = std::chrono::seconds(parse_number("SCRIPTBOX_SESSION_MAX_AGE", value, 1));
    }
    if (!(value = get("SCRIPTBOX_SESSION_IDLE_TIMEOUT")).empty()) {
        reaper.idle_timeout = std::chrono::seconds(parse_number("SCRIPTBOX_SESSION_IDLE_TIMEOUT", value, 0));
    }
    if (!(value = get("SCRIPTBOX_MAX_ARTIFACT_BYTES")).empty()) {
        artifact.max_bytes = static_cast<size_t>(parse_number("SCRIPTBOX_MAX_ARTIFACT_BYTES", value, 1));
    }
}

void ServiceConfig::apply_args(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(flag + ": missing value");
            }
            return argv[++i];
        };

        if (arg == "--port") {
            port = parse_port(arg, next(arg));
        } else if (arg == "--backend") {
            backend = parse_backend_kind(next(arg));
        } else if (arg == "--docker-host") {
            docker.host = next(arg);
        } else if (arg == "--docker-binary") {
            docker.binary = next(arg);
        } else if (arg == "--image") {
            docker.image = next(arg);
        } else if (arg == "--work-root") {
            work_root = next(arg);
        } else if (arg == "--interpreter") {
            interpreter = next(arg);
        } else if (arg == "--max-age") {
            reaper.max_age = std::chrono::seconds(parse_number(arg, next(arg), 1));
        } else if (arg == "--idle-timeout") {
            reaper.idle_timeout = std::chrono::seconds(parse_number(arg, next(arg), 0));
        } else if (arg == "--reap-interval") {
            reaper.interval = std::chrono::seconds(parse_number(arg, next(arg), 1));
        } else if (arg == "--max-artifact-bytes") {
            artifact.max_bytes = static_cast<size_t>(parse_number(arg, next(arg), 1));
        } else if (arg == "--allowed-extensions") {
            artifact.allowed_extensions = split_list(next(arg));
        } else if (arg == "--entrypoint") {
            artifact.entrypoint = parse_entrypoint(arg, next(arg));
        } else if (arg == "--memory-mb") {
            limits.memory_limit_mb = static_cast<size_t>(parse_number(arg, next(arg), 16));
        } else if (arg == "--wall-timeout") {
            limits.wall_timeout = std::chrono::seconds(parse_number(arg, next(arg), 1));
        } else if (arg == "--call-timeout") {
            backend_call_timeout = std::chrono::seconds(parse_number(arg, next(arg), 1));
        } else if (arg == "--allow-network") {
            limits.allow_network = true;
        } else if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
}

ServiceConfig ServiceConfig::load(int argc, const char* const argv[]) {
    ServiceConfig config;
    config.apply_environment([](const char* name) { return std::getenv(name); });
    config.apply_args(argc, argv);
    return config;
}

std::string ServiceConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --port N                 HTTP port (default " << DEFAULT_PORT << ")\n"
        << "  --backend KIND           process | docker (default process)\n"
        << "  --docker-host URL        Docker daemon endpoint (default $DOCKER_HOST)\n"
        << "  --docker-binary PATH     Docker CLI (default " << DEFAULT_DOCKER_BINARY << ")\n"
        << "  --image NAME             Container image (default " << DEFAULT_DOCKER_IMAGE << ")\n"
        << "  --work-root DIR          Host staging directory (default " << DEFAULT_WORK_ROOT << ")\n"
        << "  --interpreter CMD        Interpreter for the process backend (default "
        << DEFAULT_INTERPRETER << ")\n"
        << "  --max-age SEC            Reap sessions older than this (default "
        << DEFAULT_SESSION_MAX_AGE_SECONDS << ")\n"
        << "  --idle-timeout SEC       Reap sessions not polled for this long, 0 = off (default "
        << DEFAULT_SESSION_IDLE_SECONDS << ")\n"
        << "  --reap-interval SEC      Reaper scan period (default " << DEFAULT_REAP_INTERVAL_SECONDS << ")\n"
        << "  --max-artifact-bytes N   Upload size limit (default " << DEFAULT_MAX_ARTIFACT_BYTES << ")\n"
        << "  --allowed-extensions L   Comma separated, empty accepts any (default .py)\n"
        << "  --entrypoint NAME        File name inside the environment (default "
        << DEFAULT_ENTRYPOINT << ")\n"
        << "  --memory-mb N            Memory limit per environment (default " << DEFAULT_MEMORY_LIMIT_MB << ")\n"
        << "  --wall-timeout SEC       Wall clock limit per script (default "
        << DEFAULT_WALL_TIMEOUT_SECONDS << ")\n"
        << "  --call-timeout SEC       Latency bound for one backend call (default "
        << DEFAULT_BACKEND_CALL_TIMEOUT_SECONDS << ")\n"
        << "  --allow-network          Do not isolate the network\n"
        << "  --help                   Show this message\n";
    return out.str();
}

} // namespace scriptbox
