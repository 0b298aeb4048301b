#include "utils/TempWorkload.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace code_interpreter {

namespace fs = std::filesystem;

std::string TempWorkload::unique_name(const std::string& prefix, const std::string& extension) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::uint64_t bits = rng();
    std::string suffix(16, '0');
    for (auto& c : suffix) {
        c = hex[bits & 0xF];
        bits >>= 4;
    }
    return prefix + suffix + extension;
}

TempWorkload::TempWorkload(const fs::path& directory, const std::string& extension, const std::string& contents) {
    fs::create_directories(directory);

    // O_EXCL turns a name collision into a retry rather than a shared file
    int fd = -1;
    for (int attempt = 0; attempt < 8 && fd < 0; ++attempt) {
        path_ = directory / unique_name("workload_", extension);
        fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0 && errno != EEXIST) {
            throw std::system_error(errno, std::generic_category(), "open " + path_.string());
        }
    }
    if (fd < 0) {
        throw std::runtime_error("Could not allocate a unique workload name in " + directory.string());
    }

    const char* data = contents.data();
    size_t left = contents.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            remove();
            throw std::system_error(saved, std::generic_category(), "write " + path_.string());
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    ::close(fd);
}

TempWorkload::~TempWorkload() {
    remove();
}

bool TempWorkload::remove() noexcept {
    if (removed_) return false;
    removed_ = true;

    std::error_code ec;
    bool existed = fs::remove(path_, ec);
    if (ec) {
        spdlog::error("🧹 Failed to delete workload {}: {}", path_.string(), ec.message());
        return false;
    }
    return existed;
}

}
