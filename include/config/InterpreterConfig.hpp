#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "execution/CommandSandboxRuntime.hpp"
#include "execution/ExecutionTypes.hpp"
#include "llm/ChatClient.hpp"
#include "llm/RetryingCaller.hpp"

namespace code_interpreter {

enum class Environment {
    PYTHON,      // process backend
    HYPERLIGHT   // VM sandbox backend
};

Environment parse_environment(const std::string& name);
std::string to_string(Environment env);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
EnvLookup process_env();

struct InterpreterConfig {
    Environment environment = Environment::PYTHON;
    Language sandbox_language = Language::JAVASCRIPT;
    int timeout_seconds = 30;
    std::string python_path = "/usr/bin/python3";

    std::string sandbox_log_dir = "data/sandbox/logs";
    std::string sandbox_tmp_dir = "data/sandbox/tmp";
    CommandSandboxConfig sandbox_runtime;

    ChatClientConfig chat;
    RetryPolicy retry;
    bool debug = false;

    // Overlays keys present in `j`. Throws std::invalid_argument on bad values.
    void apply_json(const nlohmann::json& j);
    void apply_env(const EnvLookup& lookup);
    void validate() const;

    // defaults -> first interpreter.json found (or `explicit_path`) -> environment
    static InterpreterConfig load(const std::optional<std::string>& explicit_path = std::nullopt,
                                  const EnvLookup& lookup = process_env());

    // Resolved once. Falls back to the process backend when the sandbox
    // runtime cannot run the configured language.
    BackendConfig to_backend_config() const;
};

}
