#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ExecutionJournal.hpp"
#include "config/InterpreterConfig.hpp"
#include "execution/ExecutionDispatcher.hpp"
#include "llm/ChatClient.hpp"
#include "llm/RetryingCaller.hpp"
#include "tools/CodeExecutionTool.hpp"
#include "tools/ToolRegistry.hpp"
#include "utils/Logging.hpp"

using json = nlohmann::json;
namespace ci = code_interpreter;

namespace {

struct CliOptions {
    std::string command;
    std::optional<std::string> hyperlight;  // language, when the flag is present
    std::optional<int> timeout;
    std::optional<std::string> language;
    std::optional<std::string> config_path;
    std::vector<std::string> positional;
    bool verbose = false;
};

void print_usage() {
    std::cerr <<
        "Usage: code_interpreter <command> [options]\n"
        "\n"
        "Commands:\n"
        "  exec            Read {\"tool\":..., \"parameters\":{...}} lines from stdin\n"
        "  run FILE        Execute one source file\n"
        "  chat PROMPT     Send one prompt to the model service\n"
        "\n"
        "Options:\n"
        "  --hyperlight [LANG]  Use the VM sandbox (python, js, javascript, c, cpp; default javascript)\n"
        "  --timeout N          Process backend timeout in seconds\n"
        "  --language LANG      Language for `run` (default: backend's native language)\n"
        "  --config PATH        Configuration file (default: interpreter.json if present)\n"
        "  -v, --verbose        Enable verbose logging\n";
}

std::optional<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc && argv[i + 1][0] != '-') return std::string(argv[++i]);
            return std::nullopt;
        };

        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--hyperlight") {
            // Optional value; a following command word is not a language.
            if (i + 1 < argc && ci::try_parse_language(argv[i + 1])) {
                opts.hyperlight = argv[++i];
            } else {
                opts.hyperlight = "javascript";
            }
        } else if (arg == "--timeout") {
            auto v = next_value();
            if (!v) return std::nullopt;
            opts.timeout = std::stoi(*v);
        } else if (arg == "--language") {
            opts.language = next_value();
            if (!opts.language) return std::nullopt;
        } else if (arg == "--config") {
            opts.config_path = next_value();
            if (!opts.config_path) return std::nullopt;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.positional.push_back(arg);
        }
    }
    if (opts.command.empty()) return std::nullopt;
    return opts;
}

ci::InterpreterConfig resolve_config(const CliOptions& opts) {
    auto cfg = ci::InterpreterConfig::load(opts.config_path);
    if (opts.hyperlight) {
        cfg.environment = ci::Environment::HYPERLIGHT;
        cfg.sandbox_language = ci::parse_language(*opts.hyperlight);
    }
    if (opts.timeout) cfg.timeout_seconds = *opts.timeout;
    cfg.validate();
    return cfg;
}

std::shared_ptr<ci::ToolRegistry> build_registry(const std::shared_ptr<ci::ExecutionDispatcher>& dispatcher) {
    auto registry = std::make_shared<ci::ToolRegistry>();
    registry->register_tool(std::make_unique<ci::CodeExecutionTool>(dispatcher));
    registry->register_tool(std::make_unique<ci::GenericTool>(
        "clear_sandbox_cache",
        "Clears cached artifacts of the VM sandbox. Input: {}",
        "{\"type\":\"object\",\"properties\":{}}",
        [dispatcher](const std::string&) { return dispatcher->clear_cache(); }
    ));
    registry->register_tool(std::make_unique<ci::GenericTool>(
        "execution_history",
        "Shows recent code executions (newest first). Input: {}",
        "{\"type\":\"object\",\"properties\":{}}",
        [](const std::string&) {
            return ci::ExecutionJournal::instance().get_traces_json().dump(2, ' ', false, json::error_handler_t::replace);
        }
    ));
    return registry;
}

int run_exec_loop(ci::ToolRegistry& registry) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << registry.handle_call_line(line) << std::endl;
    }
    return 0;
}

int run_file(ci::ExecutionDispatcher& dispatcher, const CliOptions& opts) {
    if (opts.positional.empty()) {
        print_usage();
        return 2;
    }
    std::ifstream in(opts.positional[0], std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Cannot open " << opts.positional[0] << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    std::cout << dispatcher.execute(ss.str(), opts.language) << std::endl;
    return 0;
}

int run_chat(const ci::InterpreterConfig& cfg, const CliOptions& opts) {
    if (opts.positional.empty()) {
        print_usage();
        return 2;
    }
    std::string prompt;
    for (const auto& word : opts.positional) prompt += (prompt.empty() ? "" : " ") + word;

    ci::ChatClient client(cfg.chat);
    ci::RetryingCaller caller(cfg.retry);
    try {
        std::string reply = caller.call([&] { return client.complete({{"user", prompt}}); });
        std::cout << reply << std::endl;
        return 0;
    } catch (const ci::UpstreamError& e) {
        spdlog::error("💥 Chat failed after {} attempt(s): {}", caller.attempts(), e.what());
        std::cerr << e.what() << "\n";
        return 1;
    }
}

}

int main(int argc, char** argv) {
    std::optional<CliOptions> opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception&) {
        opts.reset();
    }
    if (!opts) {
        print_usage();
        return 2;
    }

    ci::configure_logging(opts->verbose);

    try {
        auto cfg = resolve_config(*opts);
        if (cfg.debug) spdlog::set_level(spdlog::level::debug);

        if (opts->command == "chat") return run_chat(cfg, *opts);

        auto dispatcher = std::make_shared<ci::ExecutionDispatcher>(cfg.to_backend_config());
        int rc = 0;
        if (opts->command == "exec") {
            auto registry = build_registry(dispatcher);
            rc = run_exec_loop(*registry);
        } else if (opts->command == "run") {
            rc = run_file(*dispatcher, *opts);
        } else {
            print_usage();
            return 2;
        }

        if (cfg.environment == ci::Environment::HYPERLIGHT) {
            ci::ExecutionJournal::instance().save_to(cfg.sandbox_log_dir);
        }
        return rc;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("💥 Fatal error: {}", e.what());
        return 1;
    }
}
