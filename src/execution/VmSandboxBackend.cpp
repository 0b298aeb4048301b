#include "execution/VmSandboxBackend.hpp"
#include "utils/OutputBuffer.hpp"
#include "utils/ScopedStdoutCapture.hpp"
#include "utils/TempWorkload.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace code_interpreter {

namespace fs = std::filesystem;

VmSandboxBackend::VmSandboxBackend(VmSandboxBackendConfig config) : config_(std::move(config)) {
    if (config_.scratch_directory.empty()) {
        throw std::invalid_argument("VM sandbox backend needs a scratch directory");
    }
}

fs::path VmSandboxBackend::workload_directory() const {
    return fs::path(config_.scratch_directory) / kWorkloadSubdir;
}

ExecutionResult VmSandboxBackend::run(const ExecutionRequest& req, ISandboxRuntime& sandbox) const {
    std::string ext = file_extension(req.language);
    if (ext.empty()) {
        return ExecutionResult::failure("Error: Unsupported language. Supported languages: python, javascript, c, cpp");
    }

    TempWorkload workload(workload_directory(), ext, req.source);
    spdlog::debug("🛡️ Submitting {} to the sandbox", workload.path().string());

    SandboxRunResult result;
    std::string captured;
    {
        // The runtime may print straight to fd 1; nothing else may log to
        // stdout inside this block.
        ScopedStdoutCapture capture(fs::path(config_.scratch_directory) / "capture");
        result = sandbox.run(workload.path().string());
        captured = capture.finish();
    }
    workload.remove();

    if (!result.success) {
        std::string detail = result.error && !result.error->empty() ? *result.error : "Unknown error";
        return ExecutionResult::failure("Execution failed: " + detail);
    }

    if (captured.empty() && result.output) captured = trim_whitespace(*result.output);
    if (captured.empty()) return ExecutionResult::ok("Execution completed successfully.");
    return ExecutionResult::ok(truncate_output(captured));
}

}
