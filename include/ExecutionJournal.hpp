#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
using json = nlohmann::json;

namespace code_interpreter {

struct ExecutionTrace {
    long long timestamp;     // ms since epoch
    std::string backend;     // "python" or "hyperlight"
    std::string language;
    bool succeeded;
    double duration_ms;
    size_t output_bytes;
};

class ExecutionJournal {
public:
    static constexpr size_t kMaxTraces = 100;

    // Singleton access
    static ExecutionJournal& instance() {
        static ExecutionJournal instance;
        return instance;
    }

    void add_trace(const ExecutionTrace& trace) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back(trace);
        if (traces_.size() > kMaxTraces) traces_.pop_front();
    }

    // Newest first
    json get_traces_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j = json::array();
        for (auto it = traces_.rbegin(); it != traces_.rend(); ++it) {
            j.push_back({
                {"timestamp", it->timestamp},
                {"backend", it->backend},
                {"language", it->language},
                {"succeeded", it->succeeded},
                {"duration_ms", it->duration_ms},
                {"output_bytes", it->output_bytes}
            });
        }
        return j;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return traces_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.clear();
    }

    // 💾 Writes <log_dir>/executions.json. Returns false on I/O failure.
    bool save_to(const std::filesystem::path& log_dir) {
        json j = get_traces_json();
        try {
            std::filesystem::create_directories(log_dir);
            std::ofstream o(log_dir / "executions.json");
            if (!o.is_open()) return false;
            o << j.dump(2, ' ', false, json::error_handler_t::replace);
            return static_cast<bool>(o);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to persist execution journal: {}", e.what());
            return false;
        }
    }

private:
    ExecutionJournal() = default;

    std::deque<ExecutionTrace> traces_;
    std::mutex mtx_;
};

}
