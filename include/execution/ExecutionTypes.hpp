#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace code_interpreter {

enum class Language {
    PYTHON,
    JAVASCRIPT,
    C,
    CPP
};

// Accepts "python", "javascript"/"js", "c", "cpp"/"c++" (any case).
// Throws std::invalid_argument for anything else.
Language parse_language(const std::string& name);
std::optional<Language> try_parse_language(const std::string& name);

std::string to_string(Language lang);
std::string file_extension(Language lang);

struct ExecutionRequest {
    const std::string source;
    const Language language;
    const int timeout_seconds;
};

struct ExecutionResult {
    bool succeeded = false;
    std::string output;
    std::optional<std::string> error_detail;

    static ExecutionResult ok(std::string out) {
        return {true, std::move(out), std::nullopt};
    }
    static ExecutionResult failure(std::string out, std::optional<std::string> detail = std::nullopt) {
        return {false, std::move(out), std::move(detail)};
    }

    // The one text the caller should see. Never empty.
    std::string user_text() const;
};

// 🧱 Backend selection, resolved once at tool construction.
struct ProcessBackendConfig {
    int timeout_seconds = 30;
    std::string python_path = "/usr/bin/python3";
};

struct VmSandboxBackendConfig {
    std::string log_directory;
    std::string scratch_directory;
    Language language = Language::JAVASCRIPT;
};

using BackendConfig = std::variant<ProcessBackendConfig, VmSandboxBackendConfig>;

std::string backend_name(const BackendConfig& config);
Language default_language(const BackendConfig& config);
std::vector<Language> supported_languages(const BackendConfig& config);

}
