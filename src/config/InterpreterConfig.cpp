#include "config/InterpreterConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace code_interpreter {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool truthy(const std::string& v) {
    std::string l = lower(v);
    return l == "true" || l == "1" || l == "yes";
}

int parse_positive(const std::string& text, const std::string& what) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used == text.size() && v > 0) return v;
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument(what + " must be a positive integer, got '" + text + "'");
}

std::vector<std::string> split_words(const std::string& s) {
    std::istringstream in(s);
    std::vector<std::string> out;
    std::string word;
    while (in >> word) out.push_back(word);
    return out;
}

}

Environment parse_environment(const std::string& name) {
    std::string l = lower(name);
    if (l == "python" || l == "process") return Environment::PYTHON;
    if (l == "hyperlight" || l == "vm-sandbox" || l == "sandbox") return Environment::HYPERLIGHT;
    throw std::invalid_argument("Unknown code environment '" + name + "'. Use 'python' or 'hyperlight'.");
}

std::string to_string(Environment env) {
    return env == Environment::HYPERLIGHT ? "hyperlight" : "python";
}

EnvLookup process_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

void InterpreterConfig::apply_json(const json& j) {
    try {
        if (j.contains("environment")) environment = parse_environment(j["environment"].get<std::string>());
        if (j.contains("hyperlight_language")) sandbox_language = parse_language(j["hyperlight_language"].get<std::string>());
        if (j.contains("timeout")) timeout_seconds = j["timeout"].get<int>();
        if (j.contains("python_path")) python_path = j["python_path"].get<std::string>();
        if (j.contains("debug")) debug = j["debug"].get<bool>();

        if (j.contains("sandbox")) {
            const auto& s = j["sandbox"];
            sandbox_log_dir = s.value("log_dir", sandbox_log_dir);
            sandbox_tmp_dir = s.value("tmp_dir", sandbox_tmp_dir);
            if (s.contains("run_timeout")) sandbox_runtime.run_timeout = std::chrono::seconds(s["run_timeout"].get<int>());
            if (s.contains("launcher")) sandbox_runtime.launcher = s["launcher"].get<std::vector<std::string>>();
            if (s.contains("interpreters")) {
                for (auto& [ext, path] : s["interpreters"].items()) sandbox_runtime.interpreters[ext] = path.get<std::string>();
            }
            if (s.contains("compilers")) {
                for (auto& [ext, path] : s["compilers"].items()) sandbox_runtime.compilers[ext] = path.get<std::string>();
            }
        }

        if (j.contains("chat")) {
            const auto& c = j["chat"];
            chat.base_url = c.value("base_url", chat.base_url);
            chat.api_key = c.value("api_key", chat.api_key);
            chat.model = c.value("model", chat.model);
            chat.timeout_ms = c.value("timeout_ms", chat.timeout_ms);
        }

        if (j.contains("retry")) {
            const auto& r = j["retry"];
            retry.max_retries = r.value("max_retries", retry.max_retries);
            retry.min_wait_seconds = r.value("min_wait", retry.min_wait_seconds);
            retry.max_wait_seconds = r.value("max_wait", retry.max_wait_seconds);
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
    }
}

void InterpreterConfig::apply_env(const EnvLookup& lookup) {
    if (auto v = lookup("CODE_ENVIRONMENT")) environment = parse_environment(*v);
    if (auto v = lookup("HYPERLIGHT_LANGUAGE")) sandbox_language = parse_language(*v);
    if (auto v = lookup("CODE_TIMEOUT")) timeout_seconds = parse_positive(*v, "CODE_TIMEOUT");
    if (auto v = lookup("PYTHON_PATH")) python_path = *v;
    if (auto v = lookup("SANDBOX_LOG_DIR")) sandbox_log_dir = *v;
    if (auto v = lookup("SANDBOX_TMP_DIR")) sandbox_tmp_dir = *v;
    if (auto v = lookup("SANDBOX_LAUNCHER")) sandbox_runtime.launcher = split_words(*v);
    if (auto v = lookup("OPENAI_BASE_URL")) chat.base_url = *v;
    if (auto v = lookup("OPENAI_API_KEY")) chat.api_key = *v;
    if (auto v = lookup("OPENAI_MODEL")) chat.model = *v;
    if (auto v = lookup("DEBUG")) debug = truthy(*v);
}

void InterpreterConfig::validate() const {
    if (timeout_seconds <= 0) throw std::invalid_argument("timeout must be a positive number of seconds");
    if (python_path.empty() || python_path[0] != '/') {
        throw std::invalid_argument("python_path must be an absolute path, got '" + python_path + "'");
    }
    if (sandbox_runtime.run_timeout.count() <= 0) {
        throw std::invalid_argument("sandbox.run_timeout must be a positive number of seconds");
    }
    if (retry.max_retries < 0) throw std::invalid_argument("retry.max_retries must not be negative");
    if (retry.min_wait_seconds < 0 || retry.max_wait_seconds < retry.min_wait_seconds) {
        throw std::invalid_argument("retry waits must satisfy 0 <= min_wait <= max_wait");
    }
}

InterpreterConfig InterpreterConfig::load(const std::optional<std::string>& explicit_path, const EnvLookup& lookup) {
    InterpreterConfig cfg;

    std::vector<std::string> search_paths = {"interpreter.json", "../interpreter.json", "config/interpreter.json"};
    if (explicit_path) search_paths = {*explicit_path};

    for (const auto& path : search_paths) {
        std::ifstream f(path);
        if (!f.is_open()) continue;
        try {
            cfg.apply_json(json::parse(f));
        } catch (const json::parse_error& e) {
            throw std::invalid_argument("Failed to parse " + path + ": " + e.what());
        }
        spdlog::info("🗂️ Loaded configuration from {}", path);
        break;
    }
    if (explicit_path && !fs::exists(*explicit_path)) {
        throw std::invalid_argument("Configuration file not found: " + *explicit_path);
    }

    cfg.apply_env(lookup);
    cfg.validate();
    return cfg;
}

BackendConfig InterpreterConfig::to_backend_config() const {
    if (environment == Environment::HYPERLIGHT) {
        if (sandbox_runtime_available(sandbox_runtime, sandbox_language)) {
            return VmSandboxBackendConfig{sandbox_log_dir, sandbox_tmp_dir, sandbox_language};
        }
        spdlog::warn("⚠️ Sandbox runtime cannot run {} here. Falling back to the python environment.",
                     to_string(sandbox_language));
    }
    return ProcessBackendConfig{timeout_seconds, python_path};
}

}
