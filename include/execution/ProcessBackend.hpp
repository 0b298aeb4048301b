#pragma once
#include <chrono>
#include <string>
#include "execution/ExecutionTypes.hpp"

namespace code_interpreter {

// Runs Python source as `<python> -c <code>` in a fresh, environment-less
// child. Nothing is written to disk for this backend.
class ProcessBackend {
public:
    static constexpr std::chrono::seconds kKillGrace{5};

    explicit ProcessBackend(ProcessBackendConfig config);

    ExecutionResult run(const ExecutionRequest& req) const;

    const ProcessBackendConfig& config() const { return config_; }

private:
    ProcessBackendConfig config_;

    static ExecutionResult unsupported_language(Language lang);
};

}
