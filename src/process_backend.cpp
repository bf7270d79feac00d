#include "process_backend.h"
#include "file_utils.h"
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <sched.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include <iostream>
#include <filesystem>

namespace scriptbox {

namespace fs = std::filesystem;

namespace {

// Syscalls a script never needs and that widen the attack surface
const std::vector<int>& denied_syscalls() {
    static const std::vector<int> syscalls = {
        SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
        SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
        SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(init_module),
        SCMP_SYS(finit_module), SCMP_SYS(delete_module), SCMP_SYS(swapon),
        SCMP_SYS(swapoff), SCMP_SYS(setns), SCMP_SYS(unshare), SCMP_SYS(bpf),
        SCMP_SYS(perf_event_open), SCMP_SYS(keyctl), SCMP_SYS(add_key),
        SCMP_SYS(request_key), SCMP_SYS(acct), SCMP_SYS(settimeofday),
        SCMP_SYS(clock_settime), SCMP_SYS(sethostname), SCMP_SYS(setdomainname)
    };
    return syscalls;
}

// From waitid(): si_code says how the child ended, si_status carries the
// exit code or the signal number
std::string describe_exit(const siginfo_t& info, int& exit_code) {
    if (info.si_code == CLD_EXITED) {
        exit_code = info.si_status;
        return "exited with code " + std::to_string(exit_code);
    }
    if (info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED) {
        int sig = info.si_status;
        exit_code = 128 + sig;
        switch (sig) {
            case SIGALRM: return "wall clock limit exceeded";
            case SIGXCPU: return "cpu time limit exceeded";
            case SIGXFSZ: return "file size limit exceeded";
            case SIGKILL: return "killed";
            default: return std::string("terminated by signal ") + strsignal(sig);
        }
    }
    exit_code = -1;
    return "unknown termination";
}

// Report errno from the child through the exec-status pipe and exit.
// Only async-signal-safe calls here.
[[noreturn]] void child_fail(int fd, int stage) {
    int payload[2] = {stage, errno};
    ssize_t ignored = write(fd, payload, sizeof(payload));
    (void)ignored;
    _exit(126);
}

const char* stage_name(int stage) {
    switch (stage) {
        case 1: return "redirect output";
        case 2: return "create namespaces";
        case 3: return "apply resource limits";
        case 4: return "enter code directory";
        case 5: return "load seccomp filter";
        case 6: return "exec interpreter";
        default: return "launch";
    }
}

} // namespace

class ProcessBackend::Impl {
public:
    struct Environment {
        std::mutex mutex;
        pid_t pid = -1;
        std::string dir;
        bool exited = false;    // Exit observed; the leader stays a zombie
        bool reaped = false;    // Leader collected, its pid (and group id) may be reused
        int exit_code = 0;
        std::string detail;
    };

    ProcessBackendOptions options_;
    bool namespaces_available_ = false;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Environment>> environments_;

    explicit Impl(const ProcessBackendOptions& options) : options_(options) {
        std::error_code ec;
        fs::create_directories(options_.work_root, ec);
        if (ec) {
            std::cerr << "[ProcessBackend] Cannot create work root " << options_.work_root
                      << ": " << ec.message() << std::endl;
        }

        if (options_.use_namespaces) {
            namespaces_available_ = ProcessBackend::test_namespace_support();
            if (!namespaces_available_) {
                std::cerr << "[ProcessBackend] Namespaces unavailable (needs CAP_SYS_ADMIN); "
                          << "network isolation relies on the seccomp filter" << std::endl;
            }
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [handle, env] : environments_) {
            std::lock_guard<std::mutex> env_lock(env->mutex);
            if (!env->reaped && env->pid > 0) {
                kill(-env->pid, SIGKILL);
                waitpid(env->pid, nullptr, 0);
            }
            std::error_code ec;
            fs::remove_all(env->dir, ec);
        }
        environments_.clear();
    }

    std::shared_ptr<Environment> find(const std::string& handle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = environments_.find(handle);
        return it == environments_.end() ? nullptr : it->second;
    }

    scmp_filter_ctx build_filter(std::string& error) {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) {
            error = "seccomp_init failed";
            return nullptr;
        }

        for (int syscall : denied_syscalls()) {
            int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0);
            if (rc < 0) {
                error = std::string("seccomp_rule_add failed: ") + strerror(-rc);
                seccomp_release(ctx);
                return nullptr;
            }
        }

        if (!options_.limits.allow_network) {
            // Unix sockets stay usable; IP sockets do not
            for (int family : {AF_INET, AF_INET6, AF_PACKET}) {
                int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                          SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(family)));
                if (rc < 0) {
                    error = std::string("seccomp_rule_add(socket) failed: ") + strerror(-rc);
                    seccomp_release(ctx);
                    return nullptr;
                }
            }
        }
        return ctx;
    }

    bool apply_resource_limits() {
        const ResourceLimits& limits = options_.limits;
        struct rlimit limit;

        // Memory limit
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(limits.memory_limit_mb) * 1024 * 1024;
        if (setrlimit(RLIMIT_AS, &limit) != 0) return false;

        // CPU seconds allowed by the quota over the wall clock window
        rlim_t cpu_seconds = static_cast<rlim_t>(limits.wall_timeout.count());
        if (limits.cpu_period_us > 0 && limits.cpu_quota_us < limits.cpu_period_us) {
            cpu_seconds = cpu_seconds * limits.cpu_quota_us / limits.cpu_period_us;
        }
        limit.rlim_cur = limit.rlim_max = cpu_seconds > 0 ? cpu_seconds : 1;
        if (setrlimit(RLIMIT_CPU, &limit) != 0) return false;

        // File size limit
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(limits.max_file_size_mb) * 1024 * 1024;
        if (setrlimit(RLIMIT_FSIZE, &limit) != 0) return false;

        // File descriptor limit
        limit.rlim_cur = limit.rlim_max = static_cast<rlim_t>(limits.max_open_files);
        if (setrlimit(RLIMIT_NOFILE, &limit) != 0) return false;

        // Wall time alarm survives exec; default action terminates
        alarm(static_cast<unsigned>(limits.wall_timeout.count()));
        return true;
    }

    ProvisionOutcome provision(const LaunchSpec& spec) {
        ProvisionOutcome outcome;

        std::string handle;
        try {
            handle = "env-" + FileUtils::random_uuid();
        } catch (const std::exception& e) {
            outcome.result = BackendResult::failure(BackendErrorCode::INTERNAL, e.what());
            return outcome;
        }

        auto env = std::make_shared<Environment>();
        env->dir = options_.work_root + "/" + handle;
        std::string code_dir = env->dir + "/code";
        std::string script_path = code_dir + "/" + spec.entrypoint;
        std::string log_path = env->dir + "/output.log";

        std::error_code ec;
        fs::create_directories(code_dir, ec);
        if (ec) {
            outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
                "cannot create environment directory: " + ec.message());
            return outcome;
        }

        auto discard = [&env]() {
            std::error_code ignored;
            fs::remove_all(env->dir, ignored);
        };

        if (!FileUtils::write_file(script_path, spec.content)) {
            discard();
            outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
                "cannot stage script into environment");
            return outcome;
        }

        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (log_fd < 0) {
            discard();
            outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
                std::string("cannot create output log: ") + strerror(errno));
            return outcome;
        }

        scmp_filter_ctx filter = nullptr;
        if (options_.use_seccomp) {
            std::string filter_error;
            filter = build_filter(filter_error);
            if (!filter) {
                close(log_fd);
                discard();
                outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE, filter_error);
                return outcome;
            }
        }

        int status_pipe[2];
        if (pipe2(status_pipe, O_CLOEXEC) == -1) {
            close(log_fd);
            if (filter) seccomp_release(filter);
            discard();
            outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
                std::string("Failed to create pipes: ") + strerror(errno));
            return outcome;
        }

        // Everything the child touches is prepared before fork
        std::vector<std::string> command = {options_.interpreter, spec.entrypoint};
        std::vector<char*> argv;
        for (const auto& arg : command) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<std::string> environment = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + code_dir,
            "LANG=C.UTF-8",
            "PYTHONUNBUFFERED=1",
            "PYTHONDONTWRITEBYTECODE=1"
        };
        std::vector<char*> envp;
        for (const auto& var : environment) {
            envp.push_back(const_cast<char*>(var.c_str()));
        }
        envp.push_back(nullptr);

        int unshare_flags = 0;
        if (namespaces_available_) {
            unshare_flags = CLONE_NEWIPC | CLONE_NEWUTS;
            if (!options_.limits.allow_network) {
                unshare_flags |= CLONE_NEWNET;
            }
        }

        pid_t pid = fork();
        if (pid == -1) {
            int err = errno;
            close(log_fd);
            close(status_pipe[0]);
            close(status_pipe[1]);
            if (filter) seccomp_release(filter);
            discard();
            outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
                std::string("Failed to fork process: ") + strerror(err));
            return outcome;
        }

        if (pid == 0) {
            // Child process
            close(status_pipe[0]);
            setpgid(0, 0);

            int devnull = open("/dev/null", O_RDONLY);
            if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
                dup2(log_fd, STDOUT_FILENO) < 0 || dup2(log_fd, STDERR_FILENO) < 0) {
                child_fail(status_pipe[1], 1);
            }

            if (unshare_flags != 0 && unshare(unshare_flags) != 0) {
                child_fail(status_pipe[1], 2);
            }

            if (!apply_resource_limits()) {
                child_fail(status_pipe[1], 3);
            }

            if (chdir(code_dir.c_str()) != 0) {
                child_fail(status_pipe[1], 4);
            }

            if (filter) {
                int rc = seccomp_load(filter);
                if (rc < 0) {
                    errno = -rc;
                    child_fail(status_pipe[1], 5);
                }
            }

            execvpe(argv[0], argv.data(), envp.data());
            child_fail(status_pipe[1], 6);
        }

        // Parent process
        close(log_fd);
        close(status_pipe[1]);
        if (filter) seccomp_release(filter);

        // EOF means exec succeeded (the pipe is close-on-exec)
        int payload[2] = {0, 0};
        ssize_t got;
        do {
            got = read(status_pipe[0], payload, sizeof(payload));
        } while (got < 0 && errno == EINTR);
        close(status_pipe[0]);

        if (got > 0) {
            waitpid(pid, nullptr, 0);
            discard();
            outcome.result = BackendResult::failure(BackendErrorCode::UNAVAILABLE,
                std::string("failed to ") + stage_name(payload[0]) + ": " + strerror(payload[1]));
            return outcome;
        }

        env->pid = pid;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            environments_[handle] = env;
        }

        outcome.handle = handle;
        return outcome;
    }

    // Caller holds env->mutex. Observes the leader's exit without reaping
    // it: while the zombie exists its pid cannot be handed to another
    // session's leader, so signalling the group stays safe until reap().
    // Returns false only if waitid itself failed.
    bool check_exit(Environment& env, bool block) {
        if (env.exited) {
            return true;
        }
        siginfo_t info;
        memset(&info, 0, sizeof(info));
        int flags = WEXITED | WNOWAIT | (block ? 0 : WNOHANG);
        int rc;
        do {
            rc = waitid(P_PID, static_cast<id_t>(env.pid), &info, flags);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            return false;
        }
        if (info.si_pid == env.pid) {
            env.exited = true;
            env.detail = describe_exit(info, env.exit_code);
        }
        return true;
    }

    // Caller holds env->mutex. Kills whatever is left of the group, then
    // collects the leader.
    void reap(Environment& env) {
        if (env.reaped || env.pid <= 0) {
            return;
        }
        // Background children may outlive the leader
        if (kill(-env.pid, SIGKILL) != 0 && errno != ESRCH) {
            std::cerr << "[ProcessBackend] Failed to kill process group " << env.pid
                      << ": " << strerror(errno) << std::endl;
        }
        pid_t waited;
        do {
            waited = waitpid(env.pid, nullptr, 0);
        } while (waited < 0 && errno == EINTR);
        env.reaped = true;
        if (!env.exited) {
            env.exited = true;
            env.exit_code = 128 + SIGKILL;
            env.detail = "killed";
        }
    }

    StatusOutcome status(const std::string& handle) {
        StatusOutcome outcome;
        auto env = find(handle);
        if (!env) {
            outcome.result = BackendResult::failure(BackendErrorCode::NOT_FOUND, "no such environment: " + handle);
            return outcome;
        }

        std::lock_guard<std::mutex> env_lock(env->mutex);
        if (!check_exit(*env, false)) {
            outcome.result = BackendResult::failure(BackendErrorCode::INTERNAL,
                std::string("waitid failed: ") + strerror(errno));
            return outcome;
        }

        if (env->exited) {
            outcome.state = EnvironmentState::EXITED;
            outcome.exit_code = env->exit_code;
            outcome.detail = env->detail;
        } else {
            outcome.state = EnvironmentState::RUNNING;
        }
        return outcome;
    }

    LogsOutcome logs(const std::string& handle) {
        LogsOutcome outcome;
        auto env = find(handle);
        if (!env) {
            outcome.result = BackendResult::failure(BackendErrorCode::NOT_FOUND, "no such environment: " + handle);
            return outcome;
        }

        std::string log_path;
        {
            std::lock_guard<std::mutex> env_lock(env->mutex);
            log_path = env->dir + "/output.log";
        }

        if (!FileUtils::read_file(log_path, options_.limits.max_output_bytes, outcome.logs)) {
            outcome.result = BackendResult::failure(BackendErrorCode::NOT_FOUND,
                "output log missing for " + handle);
        }
        return outcome;
    }

    // Caller holds env->mutex. SIGTERM the group, then SIGKILL after the
    // grace period. The leader is left unreaped.
    void terminate(Environment& env) {
        if (env.reaped || env.pid <= 0 || !check_exit(env, false) || env.exited) {
            return;
        }

        kill(-env.pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + options_.stop_grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!check_exit(env, false)) {
                break;
            }
            if (env.exited) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        kill(-env.pid, SIGKILL);
        if (!check_exit(env, true) || !env.exited) {
            env.exited = true;
            env.exit_code = 128 + SIGKILL;
            env.detail = "killed";
        }
    }

    BackendResult stop(const std::string& handle) {
        auto env = find(handle);
        if (!env) {
            return BackendResult::failure(BackendErrorCode::NOT_FOUND, "no such environment: " + handle);
        }
        std::lock_guard<std::mutex> env_lock(env->mutex);
        terminate(*env);
        return BackendResult::success();
    }

    BackendResult remove(const std::string& handle) {
        std::shared_ptr<Environment> env;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = environments_.find(handle);
            if (it == environments_.end()) {
                return BackendResult::failure(BackendErrorCode::NOT_FOUND, "no such environment: " + handle);
            }
            env = it->second;
            environments_.erase(it);
        }

        std::lock_guard<std::mutex> env_lock(env->mutex);
        terminate(*env);
        reap(*env);

        std::error_code ec;
        fs::remove_all(env->dir, ec);
        if (ec) {
            return BackendResult::failure(BackendErrorCode::INTERNAL,
                "failed to remove " + env->dir + ": " + ec.message());
        }
        return BackendResult::success();
    }
};

ProcessBackend::ProcessBackend(const ProcessBackendOptions& options)
    : impl(std::make_unique<Impl>(options)) {}

ProcessBackend::~ProcessBackend() = default;

ProvisionOutcome ProcessBackend::provision(const LaunchSpec& spec) {
    return impl->provision(spec);
}

StatusOutcome ProcessBackend::status(const std::string& handle) {
    return impl->status(handle);
}

LogsOutcome ProcessBackend::logs(const std::string& handle) {
    return impl->logs(handle);
}

BackendResult ProcessBackend::stop(const std::string& handle) {
    return impl->stop(handle);
}

BackendResult ProcessBackend::remove(const std::string& handle) {
    return impl->remove(handle);
}

bool ProcessBackend::namespaces_available() const {
    return impl->namespaces_available_;
}

pid_t ProcessBackend::leader_pid(const std::string& handle) const {
    auto env = impl->find(handle);
    if (!env) return -1;
    std::lock_guard<std::mutex> env_lock(env->mutex);
    return env->pid;
}

std::string ProcessBackend::environment_path(const std::string& handle) const {
    auto env = impl->find(handle);
    if (!env) return "";
    std::lock_guard<std::mutex> env_lock(env->mutex);
    return env->dir;
}

bool ProcessBackend::test_namespace_support() {
    pid_t pid = fork();
    if (pid == 0) {
        // Child process - try to create the namespaces we would use
        if (unshare(CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) == 0) {
            _exit(0);  // Success
        }
        _exit(1);  // Failure
    } else if (pid > 0) {
        int status;
        if (waitpid(pid, &status, 0) != pid) {
            return false;
        }
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
    return false;
}

} // namespace scriptbox
