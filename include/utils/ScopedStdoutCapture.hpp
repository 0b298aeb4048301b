#pragma once
#include <filesystem>
#include <mutex>
#include <string>

namespace code_interpreter {

// Takes exclusive ownership of the process-wide stdout descriptor (fd 1) and
// points it at a private capture file. Anything written to fd 1 while the
// guard lives (printf, std::cout, child processes inheriting fd 1) lands in
// that file. fd 1 is restored on every exit path, including exceptions.
//
// Only one capture can be active per process; a second guard blocks until
// the first one is destroyed.
class ScopedStdoutCapture {
public:
    explicit ScopedStdoutCapture(const std::filesystem::path& capture_dir);
    ~ScopedStdoutCapture();

    ScopedStdoutCapture(const ScopedStdoutCapture&) = delete;
    ScopedStdoutCapture& operator=(const ScopedStdoutCapture&) = delete;

    // Restores fd 1, returns the captured text with surrounding whitespace
    // trimmed, and deletes the capture file. Call at most once.
    std::string finish();

    bool active() const { return active_; }

private:
    static std::mutex& redirect_mutex();

    std::unique_lock<std::mutex> lock_;
    std::filesystem::path capture_path_;
    int capture_fd_ = -1;
    int saved_fd_ = -1;
    bool active_ = false;

    void restore() noexcept;
    void discard_capture_file() noexcept;
};

std::string trim_whitespace(const std::string& s);

}
