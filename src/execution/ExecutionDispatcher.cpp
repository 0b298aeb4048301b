#include "execution/ExecutionDispatcher.hpp"
#include "execution/CommandSandboxRuntime.hpp"
#include "ExecutionJournal.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace code_interpreter {

namespace fs = std::filesystem;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Backend make_backend(const BackendConfig& config) {
    return std::visit(overloaded{
        [](const ProcessBackendConfig& c) -> Backend { return ProcessBackend(c); },
        [](const VmSandboxBackendConfig& c) -> Backend { return VmSandboxBackend(c); },
    }, config);
}

SandboxOptions make_sandbox_options(const BackendConfig& config) {
    if (auto vm = std::get_if<VmSandboxBackendConfig>(&config)) {
        return {vm->log_directory, (fs::path(vm->scratch_directory) / "runtime").string()};
    }
    return {};
}

std::string join_languages(const std::vector<Language>& langs) {
    std::string out;
    for (size_t i = 0; i < langs.size(); ++i) {
        if (i) out += ", ";
        out += to_string(langs[i]);
    }
    return out;
}

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}

// --- LazySandbox ---

LazySandbox::LazySandbox(SandboxFactory factory, SandboxOptions options)
    : factory_(std::move(factory)), options_(std::move(options)) {}

ISandboxRuntime& LazySandbox::get() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (handle_) return *handle_;

    spdlog::info("🛡️ Starting sandbox runtime (logs: {}, tmp: {})", options_.log_directory, options_.tmp_directory);
    try {
        handle_ = factory_(options_);
    } catch (const std::exception& e) {
        spdlog::error("🚨 Sandbox construction failed: {}", e.what());
        throw;
    }
    if (!handle_) throw std::runtime_error("Sandbox factory returned no runtime");
    return *handle_;
}

ISandboxRuntime* LazySandbox::peek() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return handle_.get();
}

// --- ExecutionDispatcher ---

ExecutionDispatcher::ExecutionDispatcher(BackendConfig config, SandboxFactory factory)
    : config_(std::move(config)),
      backend_(make_backend(config_)),
      sandbox_(factory ? std::move(factory) : CommandSandboxRuntime::factory(), make_sandbox_options(config_)) {
    spdlog::info("⚙️ Code execution backend: {} (default language: {})",
                 backend_name(config_), to_string(default_language()));
}

std::optional<ExecutionResult> ExecutionDispatcher::validate_language(const std::string& name, Language& out) const {
    auto allowed = allowed_languages();
    auto parsed = try_parse_language(name);

    // The process backend explains its own limits for known languages.
    if (parsed && (std::holds_alternative<ProcessBackend>(backend_) ||
                   std::find(allowed.begin(), allowed.end(), *parsed) != allowed.end())) {
        out = *parsed;
        return std::nullopt;
    }
    return ExecutionResult::failure("Error: Unsupported language '" + name + "'. Supported languages: " +
                                    join_languages(allowed));
}

ExecutionResult ExecutionDispatcher::dispatch(const std::string& code, Language lang) {
    return std::visit(overloaded{
        [&](const ProcessBackend& b) {
            return b.run(ExecutionRequest{code, lang, b.config().timeout_seconds});
        },
        [&](const VmSandboxBackend& b) {
            // 0: limits belong to the sandbox runtime
            return b.run(ExecutionRequest{code, lang, 0}, sandbox_.get());
        },
    }, backend_);
}

std::string ExecutionDispatcher::execute(const std::string& code, const std::optional<std::string>& language) {
    auto start = std::chrono::steady_clock::now();
    Language lang = default_language();
    ExecutionResult result;

    try {
        std::optional<ExecutionResult> rejected;
        if (language && !language->empty()) rejected = validate_language(*language, lang);
        result = rejected ? *rejected : dispatch(code, lang);
    } catch (const std::exception& e) {
        spdlog::error("💥 {} backend raised during execution: {}", backend_name(config_), e.what());
        result = ExecutionResult::failure("", "Error: Code execution failed: " + std::string(e.what()));
    } catch (...) {
        spdlog::error("💥 {} backend raised a non-standard exception", backend_name(config_));
        result = ExecutionResult::failure("", "Error: Code execution failed due to an unknown internal error.");
    }

    std::string text = result.user_text();
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    ExecutionJournal::instance().add_trace({
        now_ms(), backend_name(config_), to_string(lang), result.succeeded, ms, text.size()
    });
    spdlog::info("{} {} execution finished in {:.0f}ms", result.succeeded ? "✅" : "❌", to_string(lang), ms);
    return text;
}

std::string ExecutionDispatcher::clear_cache() {
    if (!std::holds_alternative<VmSandboxBackend>(backend_)) {
        return "Cache clearing is only available for the hyperlight (VM sandbox) backend.";
    }
    ISandboxRuntime* handle = sandbox_.peek();
    if (!handle) return "No sandbox instance to clear.";

    try {
        return handle->clear_cache();
    } catch (const std::exception& e) {
        spdlog::error("💥 Sandbox cache clear failed: {}", e.what());
        return "Error: Failed to clear sandbox cache: " + std::string(e.what());
    }
}

}
