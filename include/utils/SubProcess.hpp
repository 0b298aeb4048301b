#pragma once
#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace code_interpreter {

struct SpawnRequest {
    // argv[0] must be an absolute path; there is no PATH lookup and no shell.
    std::vector<std::string> argv;
    // KEY=VALUE entries. Empty means the child starts with no environment at all.
    std::vector<std::string> env;
    std::optional<std::string> working_directory;
    std::optional<std::chrono::milliseconds> timeout;
    // When false the child writes straight to the parent's fd 1.
    bool capture_stdout = true;
    std::chrono::milliseconds kill_grace{5000};
    // Per-stream limit on what is kept in memory. Excess output is drained and dropped.
    std::size_t max_capture_bytes = std::numeric_limits<std::size_t>::max();
};

struct ProcessResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    bool reaped = false;
    bool stdout_clipped = false;
    bool stderr_clipped = false;
    // chdir or execve failed in the child; the program never ran.
    bool exec_failed = false;
    int exec_errno = 0;

    bool success() const {
        return reaped && !exec_failed && !timed_out && term_signal == 0 && exit_code == 0;
    }
};

class SubProcess {
public:
    // Throws std::system_error if the pipes or the fork cannot be created, and
    // std::invalid_argument for a relative executable or an argument holding NUL.
    static ProcessResult run(const SpawnRequest& req);
};

}
