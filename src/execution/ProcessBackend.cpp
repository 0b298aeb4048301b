#include "execution/ProcessBackend.hpp"
#include "utils/OutputBuffer.hpp"
#include "utils/SubProcess.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>

namespace code_interpreter {

ProcessBackend::ProcessBackend(ProcessBackendConfig config) : config_(std::move(config)) {
    if (config_.timeout_seconds <= 0) {
        throw std::invalid_argument("timeout_seconds must be positive");
    }
    if (config_.python_path.empty() || config_.python_path[0] != '/') {
        throw std::invalid_argument("python_path must be absolute: '" + config_.python_path + "'");
    }
}

ExecutionResult ProcessBackend::unsupported_language(Language lang) {
    std::string name = to_string(lang);
    return ExecutionResult::failure(
        "Error: Language '" + name + "' is not supported by the python environment. "
        "Use the hyperlight (VM sandbox) backend to run " + name + " code.");
}

ExecutionResult ProcessBackend::run(const ExecutionRequest& req) const {
    // 🛑 Fail fast, before anything is spawned
    if (req.language != Language::PYTHON) {
        return unsupported_language(req.language);
    }

    // argv cannot carry NUL; the interpreter would silently see a shorter program
    if (req.source.find('\0') != std::string::npos) {
        return ExecutionResult::failure("", std::string("Error: Code contains a NUL byte and cannot be passed to the interpreter."));
    }

    int timeout = req.timeout_seconds > 0 ? req.timeout_seconds : config_.timeout_seconds;

    SpawnRequest spawn;
    spawn.argv = {config_.python_path, "-c", req.source};
    spawn.env = {};
    spawn.timeout = std::chrono::seconds(timeout);
    spawn.kill_grace = kKillGrace;
    // One byte past the budget is enough to know truncation is needed
    spawn.max_capture_bytes = kDefaultOutputLimit + 1;

    spdlog::debug("🐍 Running {} bytes of python (timeout {}s)", req.source.size(), timeout);
    ProcessResult proc = SubProcess::run(spawn);

    if (proc.timed_out) {
        return ExecutionResult::failure("Error: Execution timed out after " + std::to_string(timeout) + "s");
    }

    if (proc.exec_failed) {
        return ExecutionResult::failure("", "Error: Could not start " + config_.python_path + ": " +
                                                std::strerror(proc.exec_errno));
    }

    return ExecutionResult::ok(truncate_output(proc.stdout_text + proc.stderr_text));
}

}
