#pragma once
#include <filesystem>
#include <string>

namespace code_interpreter {

// One submitted source file on disk, owned by exactly one in-flight request.
// The file is created in the constructor and removed exactly once: by
// remove() or, failing that, by the destructor.
class TempWorkload {
public:
    TempWorkload(const std::filesystem::path& directory, const std::string& extension, const std::string& contents);
    ~TempWorkload();

    TempWorkload(const TempWorkload&) = delete;
    TempWorkload& operator=(const TempWorkload&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Returns false if the file was already gone or could not be removed.
    bool remove() noexcept;

    static std::string unique_name(const std::string& prefix, const std::string& extension);

private:
    std::filesystem::path path_;
    bool removed_ = false;
};

}
