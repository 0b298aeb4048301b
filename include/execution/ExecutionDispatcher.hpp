#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "execution/ExecutionTypes.hpp"
#include "execution/ProcessBackend.hpp"
#include "execution/SandboxRuntime.hpp"
#include "execution/VmSandboxBackend.hpp"

namespace code_interpreter {

// Construct-once cell for the sandbox handle. Concurrent first calls build a
// single instance; a failed construction leaves the cell empty so the next
// call tries again.
//
// Only construction is serialized. Whether two requests may use the handle
// at the same time depends on the runtime; the stdout capture in
// VmSandboxBackend already serializes every run.
class LazySandbox {
public:
    LazySandbox(SandboxFactory factory, SandboxOptions options);

    ISandboxRuntime& get();
    ISandboxRuntime* peek() const;

private:
    SandboxFactory factory_;
    SandboxOptions options_;
    mutable std::mutex mtx_;
    std::unique_ptr<ISandboxRuntime> handle_;
};

using Backend = std::variant<ProcessBackend, VmSandboxBackend>;

class ExecutionDispatcher {
public:
    explicit ExecutionDispatcher(BackendConfig config, SandboxFactory factory = nullptr);

    // Never throws. Returns a non-empty, human-readable result.
    std::string execute(const std::string& code, const std::optional<std::string>& language = std::nullopt);

    // Status line. Informational no-op unless the sandbox backend is active.
    std::string clear_cache();

    const BackendConfig& config() const { return config_; }
    Language default_language() const { return code_interpreter::default_language(config_); }
    std::vector<Language> allowed_languages() const { return supported_languages(config_); }
    bool sandbox_ready() const { return sandbox_.peek() != nullptr; }

private:
    BackendConfig config_;
    Backend backend_;
    LazySandbox sandbox_;

    ExecutionResult dispatch(const std::string& code, Language lang);
    std::optional<ExecutionResult> validate_language(const std::string& name, Language& out) const;
};

}
