#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace code_interpreter {

struct SandboxOptions {
    std::string log_directory;
    std::string tmp_directory;
};

struct SandboxRunResult {
    bool success = false;
    std::optional<std::string> error;
    // Some runtimes return output here, others write it straight to fd 1.
    std::optional<std::string> output;
};

// 🛡️ Connection to an external VM-isolation runtime. The runtime owns its own
// resource limits; callers apply no timeout of their own.
class ISandboxRuntime {
public:
    virtual ~ISandboxRuntime() = default;

    virtual SandboxRunResult run(const std::string& file_path) = 0;

    // Drops whatever the runtime cached between runs. Returns a status line.
    virtual std::string clear_cache() { return "Nothing to clear."; }
};

using SandboxFactory = std::function<std::unique_ptr<ISandboxRuntime>(const SandboxOptions&)>;

}
