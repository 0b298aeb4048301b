#include "llm/ChatClient.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace code_interpreter {

using json = nlohmann::json;

ChatClient::ChatClient(ChatClientConfig config) : config_(std::move(config)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') config_.base_url.pop_back();
    if (config_.base_url.empty()) throw std::invalid_argument("Chat base URL must be set");
}

json ChatClient::build_request_body(const std::string& model, const std::vector<ChatMessage>& messages) {
    json msgs = json::array();
    for (const auto& m : messages) {
        msgs.push_back({{"role", m.role}, {"content", m.content}});
    }
    return {{"model", model}, {"messages", msgs}};
}

std::string ChatClient::extract_reply(const std::string& response_body) {
    try {
        auto j = json::parse(response_body);
        if (j.contains("choices") && !j["choices"].empty()) {
            const auto& msg = j["choices"][0]["message"];
            if (msg.contains("content") && msg["content"].is_string()) {
                return msg["content"].get<std::string>();
            }
            return "";
        }
    } catch (const json::exception& e) {
        throw UpstreamError(200, std::string("Malformed completion response: ") + e.what());
    }
    throw UpstreamError(200, "Completion response had no choices");
}

std::string ChatClient::status_reason(int status) {
    switch (status) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "HTTP Error";
    }
}

UpstreamError ChatClient::error_for_status(int status, const std::string& body) {
    std::string detail = body;
    try {
        auto j = json::parse(body);
        if (j.contains("error") && j["error"].is_object()) {
            detail = j["error"].value("message", body);
        }
    } catch (const json::exception&) {
        // plain-text error body; keep it as is
    }
    if (detail.size() > 500) detail = detail.substr(0, 500);
    return UpstreamError(status, std::to_string(status) + " " + status_reason(status) + ": " + detail);
}

std::string ChatClient::complete(const std::vector<ChatMessage>& messages) {
    cpr::Header headers{{"Content-Type", "application/json"}};
    if (!config_.api_key.empty()) headers["Authorization"] = "Bearer " + config_.api_key;

    cpr::Response r = cpr::Post(
        cpr::Url{config_.base_url + "/chat/completions"},
        cpr::Body{build_request_body(config_.model, messages).dump()},
        headers,
        cpr::Timeout{config_.timeout_ms});

    if (r.error) {
        spdlog::warn("🌐 Chat request failed before a response: {}", r.error.message);
        throw UpstreamError(0, "Connection error: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::warn("🌐 Chat request returned HTTP {}", r.status_code);
        throw error_for_status(static_cast<int>(r.status_code), r.text);
    }
    return extract_reply(r.text);
}

}
