#include "execution/CommandSandboxRuntime.hpp"
#include "utils/OutputBuffer.hpp"
#include "utils/ScopedStdoutCapture.hpp"
#include "utils/SubProcess.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <cstring>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace code_interpreter {

namespace fs = std::filesystem;

namespace {

bool is_executable(const std::string& path) {
    return !path.empty() && path[0] == '/' && ::access(path.c_str(), X_OK) == 0;
}

std::string read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

CommandSandboxRuntime::CommandSandboxRuntime(SandboxOptions options, CommandSandboxConfig config)
    : options_(std::move(options)), config_(std::move(config)) {
    if (options_.tmp_directory.empty()) {
        throw std::invalid_argument("Sandbox tmp directory must be set");
    }
    if (!config_.launcher.empty() && !is_executable(config_.launcher[0])) {
        throw std::runtime_error("Sandbox launcher is not an executable absolute path: " + config_.launcher[0]);
    }
    fs::create_directories(options_.tmp_directory);

    // Not registered with spdlog: the host's global level must not silence sandbox.log
    if (!options_.log_directory.empty()) {
        fs::create_directories(options_.log_directory);
        auto log_path = fs::path(options_.log_directory) / "sandbox.log";
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string());
        log_ = std::make_shared<spdlog::logger>("sandbox", std::move(sink));
    } else {
        log_ = std::make_shared<spdlog::logger>("sandbox");
    }
    log_->set_level(spdlog::level::info);
    log_->flush_on(spdlog::level::info);
    log_->info("Sandbox runtime started (tmp={}, launcher={})",
               options_.tmp_directory, config_.launcher.empty() ? "<none>" : config_.launcher[0]);
}

SandboxFactory CommandSandboxRuntime::factory(CommandSandboxConfig config) {
    return [config](const SandboxOptions& options) -> std::unique_ptr<ISandboxRuntime> {
        return std::make_unique<CommandSandboxRuntime>(options, config);
    };
}

SandboxRunResult CommandSandboxRuntime::run(const std::string& file_path) {
    std::string ext = fs::path(file_path).extension().string();

    auto interp = config_.interpreters.find(ext);
    if (interp != config_.interpreters.end()) {
        if (!is_executable(interp->second)) {
            return {false, "Interpreter for " + ext + " not available: " + interp->second, std::nullopt};
        }
        return exec_inherited({interp->second, file_path});
    }

    auto compiler = config_.compilers.find(ext);
    if (compiler != config_.compilers.end()) {
        return compile_and_run(file_path, compiler->second);
    }

    return {false, "Unsupported workload type '" + ext + "'", std::nullopt};
}

SandboxRunResult CommandSandboxRuntime::exec_inherited(std::vector<std::string> argv) {
    std::vector<std::string> full = config_.launcher;
    full.insert(full.end(), argv.begin(), argv.end());

    SpawnRequest req;
    req.argv = std::move(full);
    req.env = {};
    req.working_directory = options_.tmp_directory;
    req.capture_stdout = false;
    req.timeout = config_.run_timeout;
    req.max_capture_bytes = kDefaultOutputLimit + 1;

    ProcessResult proc = SubProcess::run(req);
    log_->info("run {} -> exit {} (signal {}, timed out {})", argv.back(), proc.exit_code, proc.term_signal,
               proc.timed_out);

    if (proc.success()) return {true, std::nullopt, std::nullopt};
    if (proc.exec_failed) {
        return {false, "Could not start " + req.argv[0] + ": " + std::strerror(proc.exec_errno), std::nullopt};
    }
    if (proc.timed_out) {
        return {false, "Execution timed out after " + std::to_string(config_.run_timeout.count()) + "s", std::nullopt};
    }

    std::string detail = truncate_output(trim_whitespace(proc.stderr_text));
    if (detail.empty()) {
        detail = proc.term_signal != 0 ? "Terminated by signal " + std::to_string(proc.term_signal)
                                       : "Exit code " + std::to_string(proc.exit_code);
    }
    return {false, detail, std::nullopt};
}

SandboxRunResult CommandSandboxRuntime::compile_and_run(const std::string& file_path, const std::string& compiler) {
    if (!is_executable(compiler)) {
        return {false, "Compiler not available: " + compiler, std::nullopt};
    }

    // Identical sources share one binary until clear_cache(). The source is
    // kept beside the binary and compared on every hit, so a hash collision
    // recompiles instead of running someone else's program.
    std::string source = read_all(file_path);
    std::string ext = fs::path(file_path).extension().string();
    std::string stem = "build_" + std::to_string(std::hash<std::string>{}(ext + source));
    fs::path binary = fs::path(options_.tmp_directory) / (stem + ".bin");
    fs::path cached_source = fs::path(options_.tmp_directory) / (stem + ".src");

    bool hit = fs::exists(binary) && fs::exists(cached_source) && read_all(cached_source.string()) == ext + source;
    if (!hit) {
        std::error_code ec;
        fs::remove(cached_source, ec);

        SpawnRequest req;
        req.argv = {compiler, "-O1", "-o", binary.string(), file_path};
        req.env = {"PATH=/usr/bin:/bin"};
        req.working_directory = options_.tmp_directory;
        req.timeout = config_.compile_timeout;
        req.max_capture_bytes = kDefaultOutputLimit + 1;

        ProcessResult proc = SubProcess::run(req);
        log_->info("compile {} -> exit {}", file_path, proc.exit_code);
        if (!proc.success()) {
            fs::remove(binary, ec);
            std::string detail = proc.timed_out ? "compiler timed out"
                               : proc.exec_failed ? std::string("could not start ") + compiler + ": " + std::strerror(proc.exec_errno)
                               : truncate_output(trim_whitespace(proc.stderr_text + proc.stdout_text));
            return {false, "Compilation failed:\n" + detail, std::nullopt};
        }

        std::ofstream out(cached_source, std::ios::binary | std::ios::trunc);
        out << ext << source;
        if (!out) {
            log_->warn("could not record {}; binary will not be reused", cached_source.string());
            out.close();
            fs::remove(cached_source, ec);
        }
    } else {
        log_->debug("cache hit {}", binary.string());
    }

    return exec_inherited({binary.string()});
}

std::string CommandSandboxRuntime::clear_cache() {
    size_t removed = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(options_.tmp_directory, ec)) {
        const auto name = entry.path().filename().string();
        if (name.rfind("build_", 0) != 0) continue;
        if (entry.path().extension() == ".bin") {
            if (fs::remove(entry.path(), ec)) ++removed;
        } else if (entry.path().extension() == ".src") {
            fs::remove(entry.path(), ec);
        }
    }
    log_->info("cache cleared ({} artifacts)", removed);
    return "Sandbox cache cleared (" + std::to_string(removed) + " compiled artifacts removed).";
}

bool sandbox_runtime_available(const CommandSandboxConfig& config, Language lang) {
    if (!config.launcher.empty() && !is_executable(config.launcher[0])) return false;

    std::string ext = file_extension(lang);
    auto interp = config.interpreters.find(ext);
    if (interp != config.interpreters.end()) return is_executable(interp->second);
    auto compiler = config.compilers.find(ext);
    if (compiler != config.compilers.end()) return is_executable(compiler->second);
    return false;
}

}
