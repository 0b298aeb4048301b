#include "utils/SubProcess.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace code_interpreter {

namespace {

using Clock = std::chrono::steady_clock;
constexpr auto kReapInterval = std::chrono::milliseconds(10);

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) throw_errno("pipe2");
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() {
        if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

// Reads once from a ready descriptor. Bytes past `cap` are read and dropped
// so the child never stalls on a full pipe. Returns false once the stream is done.
bool drain_once(int fd, std::string& sink, size_t cap, bool& clipped) {
    char buf[65536];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        size_t got = static_cast<size_t>(n);
        size_t room = cap > sink.size() ? cap - sink.size() : 0;
        sink.append(buf, std::min(got, room));
        if (got > room) clipped = true;
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

void record_status(int status, ProcessResult& result) {
    result.reaped = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
}

// Non-blocking reap. True once the child is gone.
bool try_reap(pid_t pid, ProcessResult& result) {
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        record_status(status, result);
        return true;
    }
    if (r < 0 && errno != EINTR) {
        // ECHILD: nothing left to wait for.
        result.reaped = true;
        return true;
    }
    return false;
}

void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

void reap_within(pid_t pid, std::chrono::milliseconds grace, ProcessResult& result) {
    auto until = Clock::now() + grace;
    while (Clock::now() < until) {
        if (try_reap(pid, result)) return;
        std::this_thread::sleep_for(kReapInterval);
    }
    if (!try_reap(pid, result)) {
        spdlog::warn("⚠️ Process {} did not exit within {}ms of SIGKILL. Abandoning it.", pid, grace.count());
    }
}

std::vector<char*> to_c_array(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (const auto& s : items) out.push_back(const_cast<char*>(s.c_str()));
    out.push_back(nullptr);
    return out;
}

}

ProcessResult SubProcess::run(const SpawnRequest& req) {
    if (req.argv.empty() || req.argv[0].empty() || req.argv[0][0] != '/') {
        throw std::invalid_argument("SubProcess requires an absolute executable path");
    }
    for (const auto& arg : req.argv) {
        if (arg.find('\0') != std::string::npos) {
            throw std::invalid_argument("SubProcess arguments must not contain NUL bytes");
        }
    }

    Pipe out_pipe;
    Pipe err_pipe;
    // Carries the child's errno if chdir or execve fails; closed by a successful exec.
    Pipe status_pipe;

    // Everything the child touches is prepared before fork().
    auto argv = to_c_array(req.argv);
    auto envp = to_c_array(req.env);
    const char* workdir = req.working_directory ? req.working_directory->c_str() : nullptr;

    const pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) throw_errno("fork");

    if (pid == 0) {
        ::setpgid(0, 0);
        // Dies with the host rather than outliving it.
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parent) ::_exit(127);

        auto report_and_exit = [&](int err) {
            (void)!::write(status_pipe.write_end(), &err, sizeof(err));
            ::_exit(127);
        };

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) ::close(devnull);
        }
        if (req.capture_stdout) ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);

        if (workdir && ::chdir(workdir) != 0) report_and_exit(errno);

        ::execve(argv[0], argv.data(), envp.data());
        report_and_exit(errno);
    }

    ::setpgid(pid, pid);
    out_pipe.close_write();
    err_pipe.close_write();
    status_pipe.close_write();
    if (!req.capture_stdout) out_pipe.close_read();

    ProcessResult result;

    // Returns at exec time: EOF on success, the child's errno on failure.
    int child_errno = 0;
    ssize_t got;
    do {
        got = ::read(status_pipe.read_end(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        result.exec_failed = true;
        result.exec_errno = child_errno;
        spdlog::warn("🚫 Could not start {}: {}", req.argv[0], std::strerror(child_errno));
        reap_within(pid, req.kill_grace, result);
        return result;
    }

    spdlog::debug("⚙️ Spawned pid {} ({})", pid, req.argv[0]);
    std::optional<Clock::time_point> deadline;
    if (req.timeout) deadline = Clock::now() + *req.timeout;

    bool out_open = req.capture_stdout;
    bool err_open = true;

    // 1. Collect output until both streams close or the deadline passes
    while (out_open || err_open) {
        int wait_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
            if (left <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        pollfd fds[2];
        int nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { out_idx = nfds; fds[nfds++] = {out_pipe.read_end(), POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = {err_pipe.read_end(), POLLIN, 0}; }

        int rc = ::poll(fds, static_cast<nfds_t>(nfds), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            kill_group(pid);
            reap_within(pid, req.kill_grace, result);
            throw std::system_error(saved, std::generic_category(), "poll");
        }
        if (rc == 0) continue;

        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            out_open = drain_once(out_pipe.read_end(), result.stdout_text, req.max_capture_bytes, result.stdout_clipped);
        }
        if (err_idx >= 0 && fds[err_idx].revents != 0) {
            err_open = drain_once(err_pipe.read_end(), result.stderr_text, req.max_capture_bytes, result.stderr_clipped);
        }
    }

    // 2. Wait for the exit status under the same deadline
    while (!result.timed_out) {
        if (try_reap(pid, result)) break;
        if (deadline && Clock::now() >= *deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(kReapInterval);
    }

    if (result.timed_out) {
        spdlog::warn("⏱️ pid {} exceeded its deadline. Sending SIGKILL.", pid);
        kill_group(pid);
        reap_within(pid, req.kill_grace, result);
    } else {
        // Leftover members of the group (background children) go too.
        ::kill(-pid, SIGKILL);
    }

    return result;
}

}
