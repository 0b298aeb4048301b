#pragma once
#include "tools/ToolRegistry.hpp"
#include "execution/ExecutionDispatcher.hpp"
#include <memory>
#include <optional>
#include <string>

namespace code_interpreter {

class CodeExecutionTool : public ITool {
public:
    explicit CodeExecutionTool(std::shared_ptr<ExecutionDispatcher> dispatcher)
        : dispatcher_(std::move(dispatcher)) {}

    ToolMetadata get_metadata() override {
        nlohmann::json langs = nlohmann::json::array();
        for (auto lang : dispatcher_->allowed_languages()) langs.push_back(to_string(lang));

        nlohmann::json schema = {
            {"type", "object"},
            {"properties", {
                {"code", {{"type", "string"}, {"description", "Source code to execute"}}},
                {"language", {{"type", "string"}, {"enum", langs},
                              {"default", to_string(dispatcher_->default_language())}}}
            }},
            {"required", nlohmann::json::array({"code"})}
        };
        return {"execute_code", describe(), schema.dump()};
    }

    std::string execute(const std::string& args_json) override {
        try {
            auto j = nlohmann::json::parse(args_json);
            std::string code = j.value("code", "");
            std::optional<std::string> lang;
            if (j.contains("language") && j["language"].is_string()) lang = j["language"].get<std::string>();

            if (code.empty()) return "ERROR: No code provided.";

            return dispatcher_->execute(code, lang);
        } catch (const std::exception& e) {
            return "ERROR: Execution Tool Exception: " + std::string(e.what());
        }
    }

private:
    std::shared_ptr<ExecutionDispatcher> dispatcher_;

    std::string describe() const {
        if (std::holds_alternative<ProcessBackendConfig>(dispatcher_->config())) {
            return "Executes Python code in a sandboxed subprocess and returns stdout and stderr. "
                   "Use print() to show values.";
        }
        bool js = dispatcher_->default_language() == Language::JAVASCRIPT;
        return std::string("Executes code in a secure VM-isolated sandbox and returns its output. ") +
               (js ? "Write JavaScript and use console.log() to show values."
                   : "Use print() (Python) or the language's standard output to show values.");
    }
};

}
