#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_interpreter {

struct ChatClientConfig {
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    int timeout_ms = 120000;
};

struct ChatMessage {
    std::string role;
    std::string content;
};

// Non-200 upstream answer. what() starts with "<status> <reason>", e.g.
// "429 Too Many Requests: ...", which is what RetryingCaller matches on.
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// Minimal OpenAI-compatible chat-completions client.
class ChatClient {
public:
    explicit ChatClient(ChatClientConfig config);

    // Throws UpstreamError on transport failure or any non-200 response.
    std::string complete(const std::vector<ChatMessage>& messages);

    static nlohmann::json build_request_body(const std::string& model, const std::vector<ChatMessage>& messages);
    static std::string extract_reply(const std::string& response_body);
    static std::string status_reason(int status);
    static UpstreamError error_for_status(int status, const std::string& body);

private:
    ChatClientConfig config_;
};

}
