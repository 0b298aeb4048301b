#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include "execution/ExecutionTypes.hpp"
#include "execution/SandboxRuntime.hpp"

namespace code_interpreter {

struct CommandSandboxConfig {
    // Isolation wrapper prepended to every command line, e.g.
    // {"/usr/local/bin/vm-run", "--"}. Empty runs the interpreter directly.
    std::vector<std::string> launcher;
    // Extension (".py", ".js") -> absolute interpreter path.
    std::map<std::string, std::string> interpreters = {
        {".py", "/usr/bin/python3"},
        {".js", "/usr/bin/node"},
    };
    // Extension (".c", ".cpp") -> absolute compiler path.
    std::map<std::string, std::string> compilers = {
        {".c", "/usr/bin/cc"},
        {".cpp", "/usr/bin/c++"},
    };
    std::chrono::milliseconds compile_timeout{60000};
    // Wall-clock limit for one workload; the process group is killed when it passes.
    std::chrono::seconds run_timeout{30};
};

// Runs workloads as child processes under a launcher. The child inherits
// the caller's fd 1, so program output goes wherever stdout currently points.
class CommandSandboxRuntime : public ISandboxRuntime {
public:
    CommandSandboxRuntime(SandboxOptions options, CommandSandboxConfig config = {});

    SandboxRunResult run(const std::string& file_path) override;
    std::string clear_cache() override;

    static SandboxFactory factory(CommandSandboxConfig config = {});

private:
    SandboxOptions options_;
    CommandSandboxConfig config_;
    std::shared_ptr<spdlog::logger> log_;

    SandboxRunResult compile_and_run(const std::string& file_path, const std::string& compiler);
    SandboxRunResult exec_inherited(std::vector<std::string> argv);
};

// True when the launcher (if any) and the tool for `lang` are executable.
bool sandbox_runtime_available(const CommandSandboxConfig& config, Language lang);

}
