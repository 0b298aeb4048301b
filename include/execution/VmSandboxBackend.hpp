#pragma once
#include <filesystem>
#include <string>
#include "execution/ExecutionTypes.hpp"
#include "execution/SandboxRuntime.hpp"

namespace code_interpreter {

// Hands workloads to an external VM-isolated runtime. Each call writes the
// source to a uniquely named file under <scratch>/workloads, captures fd 1
// for the duration of the runtime call, and deletes the file afterwards.
class VmSandboxBackend {
public:
    static constexpr const char* kWorkloadSubdir = "workloads";

    explicit VmSandboxBackend(VmSandboxBackendConfig config);

    ExecutionResult run(const ExecutionRequest& req, ISandboxRuntime& sandbox) const;

    const VmSandboxBackendConfig& config() const { return config_; }
    std::filesystem::path workload_directory() const;

private:
    VmSandboxBackendConfig config_;
};

}
