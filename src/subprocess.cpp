#include "subprocess.h"
#include "constants.h"
#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <thread>

namespace scriptbox {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

CommandResult Subprocess::run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout,
                              size_t max_output) {
    CommandResult result;
    if (argv.empty()) {
        result.launch_failed = true;
        result.error_message = "empty command";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        result.launch_failed = true;
        result.error_message = std::string("Failed to create pipes: ") + strerror(errno);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return result;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        result.launch_failed = true;
        result.error_message = std::string("Failed to fork process: ") + strerror(errno);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        // 127 mirrors the shell's "command not found"
        _exit(127);
    }

    // Parent process
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[PIPE_BUFFER_SIZE];
    int open_streams = 2;

    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        fds[0] = {stdout_pipe[0], POLLIN, 0};
        fds[1] = {stderr_pipe[0], POLLIN, 0};

        int ready = poll(fds, 2, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error_message = std::string("poll failed: ") + strerror(errno);
            result.timed_out = true;
            break;
        }
        if (ready == 0) {
            result.timed_out = true;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t bytes_read = read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes_read <= 0) {
                if (bytes_read < 0 && errno == EINTR) continue;
                if (i == 0) close_fd(stdout_pipe[0]); else close_fd(stderr_pipe[0]);
                open_streams--;
                continue;
            }
            std::string& target = (i == 0) ? result.stdout_output : result.stderr_output;
            if (target.size() < max_output) {
                target.append(buffer, std::min(static_cast<size_t>(bytes_read), max_output - target.size()));
            }
        }
    }

    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    int status = 0;
    if (result.timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.exit_code = decode_wait_status(status);
        return result;
    }

    // Streams closed; the child is exiting. Still bound the wait.
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            result.exit_code = decode_wait_status(status);
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.launch_failed = true;
            result.error_message = std::string("waitpid failed: ") + strerror(errno);
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            result.exit_code = decode_wait_status(status);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (result.exit_code == 127 && result.stderr_output.empty()) {
        result.launch_failed = true;
        result.error_message = "command not found: " + argv[0];
    }
    return result;
}

} // namespace scriptbox
