#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace scriptbox {

struct CommandResult {
    int exit_code = -1;           // 128+signo if killed by a signal
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool launch_failed = false;   // fork/exec/pipe error, see error_message
    std::string error_message;

    bool ok() const { return !launch_failed && !timed_out && exit_code == 0; }
};

// Run a command without a shell, feeding it nothing on stdin.
// The child is killed (SIGKILL) once the timeout expires so every call
// returns within roughly `timeout`. Output beyond max_output bytes per
// stream is discarded.
class Subprocess {
public:
    static CommandResult run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             size_t max_output = 10 * 1024 * 1024);
};

} // namespace scriptbox
