#include "utils/ScopedStdoutCapture.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

namespace code_interpreter {

namespace fs = std::filesystem;

std::string trim_whitespace(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::mutex& ScopedStdoutCapture::redirect_mutex() {
    static std::mutex mtx;
    return mtx;
}

ScopedStdoutCapture::ScopedStdoutCapture(const fs::path& capture_dir)
    : lock_(redirect_mutex()) {
    fs::create_directories(capture_dir);

    std::string tmpl = (capture_dir / "stdout_capture_XXXXXX").string();
    capture_fd_ = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (capture_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "mkostemp " + tmpl);
    }
    capture_path_ = tmpl;

    // Anything already buffered belongs to the real stdout
    std::cout.flush();
    std::fflush(stdout);

    saved_fd_ = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 0);
    if (saved_fd_ < 0) {
        int saved = errno;
        discard_capture_file();
        throw std::system_error(saved, std::generic_category(), "dup stdout");
    }

    if (::dup2(capture_fd_, STDOUT_FILENO) < 0) {
        int saved = errno;
        ::close(saved_fd_);
        saved_fd_ = -1;
        discard_capture_file();
        throw std::system_error(saved, std::generic_category(), "dup2 capture -> stdout");
    }
    active_ = true;
}

ScopedStdoutCapture::~ScopedStdoutCapture() {
    restore();
    discard_capture_file();
}

void ScopedStdoutCapture::restore() noexcept {
    if (!active_) return;
    active_ = false;

    std::cout.flush();
    std::fflush(stdout);

    while (::dup2(saved_fd_, STDOUT_FILENO) < 0 && errno == EINTR) {}
    ::close(saved_fd_);
    saved_fd_ = -1;
}

void ScopedStdoutCapture::discard_capture_file() noexcept {
    if (capture_fd_ >= 0) {
        ::close(capture_fd_);
        capture_fd_ = -1;
    }
    if (!capture_path_.empty()) {
        std::error_code ec;
        fs::remove(capture_path_, ec);
        if (ec) spdlog::warn("🧹 Could not delete capture file {}: {}", capture_path_.string(), ec.message());
        capture_path_.clear();
    }
}

std::string ScopedStdoutCapture::finish() {
    restore();

    std::string captured;
    if (!capture_path_.empty()) {
        std::ifstream in(capture_path_, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        captured = ss.str();
    }
    discard_capture_file();
    return trim_whitespace(captured);
}

}
