#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace code_interpreter {

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string parameters_schema; // JSON Schema, serialized
};

class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    // Takes the call's JSON arguments; always answers with text.
    virtual std::string execute(const std::string& args_json) = 0;
};

// Wraps a lambda as a tool
class GenericTool : public ITool {
public:
    using Handler = std::function<std::string(const std::string&)>;

    GenericTool(std::string name, std::string description, std::string schema, Handler handler)
        : meta_{std::move(name), std::move(description), std::move(schema)}, handler_(std::move(handler)) {}

    ToolMetadata get_metadata() override { return meta_; }
    std::string execute(const std::string& args_json) override { return handler_(args_json); }

private:
    ToolMetadata meta_;
    Handler handler_;
};

class ToolRegistry {
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto name = tool->get_metadata().name;
        spdlog::debug("🔧 Registered tool: {}", name);
        tools_[name] = std::move(tool);
    }

    bool has_tool(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return tools_.count(name) > 0;
    }

    std::string execute_tool(const std::string& name, const std::string& args_json) {
        ITool* tool = nullptr;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = tools_.find(name);
            if (it != tools_.end()) tool = it->second.get();
        }
        if (!tool) return "ERROR: Unknown tool '" + name + "'.";
        return tool->execute(args_json);
    }

    // One `{"tool": ..., "parameters": {...}}` line in, one `{"tool": ..., "result": ...}`
    // line out. Never throws on tool output: bytes that are not UTF-8 become U+FFFD.
    std::string handle_call_line(const std::string& line) {
        nlohmann::json reply;
        try {
            auto call = nlohmann::json::parse(line);
            std::string tool = call.value("tool", "");
            nlohmann::json params = call.contains("parameters") ? call["parameters"] : nlohmann::json::object();
            reply = {{"tool", tool}, {"result", execute_tool(tool, params.dump())}};
        } catch (const nlohmann::json::exception& e) {
            reply = {{"tool", nullptr}, {"result", std::string("ERROR: Malformed tool call: ") + e.what()}};
        }
        return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    // OpenAI-style function declarations for every registered tool
    nlohmann::json get_tool_definitions() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json defs = nlohmann::json::array();
        for (const auto& [name, tool] : tools_) {
            auto meta = tool->get_metadata();
            defs.push_back({
                {"type", "function"},
                {"function", {
                    {"name", meta.name},
                    {"description", meta.description},
                    {"parameters", nlohmann::json::parse(meta.parameters_schema)}
                }}
            });
        }
        return defs;
    }

    std::vector<std::string> list_tools() const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> names;
        for (const auto& [name, _] : tools_) names.push_back(name);
        return names;
    }

private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
    mutable std::mutex mtx_;
};

}
