#include "execution/ExecutionTypes.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace code_interpreter {

std::optional<Language> try_parse_language(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "python" || lower == "py") return Language::PYTHON;
    if (lower == "javascript" || lower == "js") return Language::JAVASCRIPT;
    if (lower == "c") return Language::C;
    if (lower == "cpp" || lower == "c++") return Language::CPP;
    return std::nullopt;
}

Language parse_language(const std::string& name) {
    auto lang = try_parse_language(name);
    if (!lang) {
        throw std::invalid_argument("Unknown language '" + name + "'. Supported: python, javascript, c, cpp");
    }
    return *lang;
}

std::string to_string(Language lang) {
    switch (lang) {
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::C: return "c";
        case Language::CPP: return "cpp";
    }
    return "unknown";
}

std::string file_extension(Language lang) {
    switch (lang) {
        case Language::PYTHON: return ".py";
        case Language::JAVASCRIPT: return ".js";
        case Language::C: return ".c";
        case Language::CPP: return ".cpp";
    }
    return "";
}

std::string ExecutionResult::user_text() const {
    if (!succeeded && error_detail && !error_detail->empty()) return *error_detail;
    if (!output.empty()) return output;
    if (succeeded) return "(No output)";
    return "Execution failed: Unknown error";
}

std::string backend_name(const BackendConfig& config) {
    return std::holds_alternative<ProcessBackendConfig>(config) ? "python" : "hyperlight";
}

Language default_language(const BackendConfig& config) {
    if (auto vm = std::get_if<VmSandboxBackendConfig>(&config)) return vm->language;
    return Language::PYTHON;
}

std::vector<Language> supported_languages(const BackendConfig& config) {
    if (std::holds_alternative<ProcessBackendConfig>(config)) return {Language::PYTHON};
    return {Language::PYTHON, Language::JAVASCRIPT, Language::C, Language::CPP};
}

}
