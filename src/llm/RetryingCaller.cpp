#include "llm/RetryingCaller.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>
#include <regex>
#include <thread>
#include <spdlog/spdlog.h>

namespace code_interpreter {

const char* to_string(RetryState state) {
    switch (state) {
        case RetryState::IDLE: return "idle";
        case RetryState::CALLING: return "calling";
        case RetryState::WAITING: return "waiting";
        case RetryState::SUCCEEDED: return "succeeded";
        case RetryState::FAILED: return "failed";
    }
    return "unknown";
}

bool is_rate_limit_message(const std::string& message) {
    static const std::regex pattern("(too many requests|429)", std::regex::icase);
    return std::regex_search(message, pattern, std::regex_constants::match_continuous);
}

double backoff_seconds(const RetryPolicy& policy, int attempt, double jitter_fraction) {
    int exponent = std::max(attempt, 1) - 1;
    double wait = std::min(policy.min_wait_seconds * std::pow(2.0, exponent), policy.max_wait_seconds);
    jitter_fraction = std::clamp(jitter_fraction, 0.0, 1.0);
    return wait + wait * 0.1 * jitter_fraction;
}

Sleeper real_sleeper() {
    return [](std::chrono::duration<double> d) { std::this_thread::sleep_for(d); };
}

JitterSource uniform_jitter() {
    return [] {
        static std::mutex mtx;
        static std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        std::lock_guard<std::mutex> lock(mtx);
        return dist(rng);
    };
}

RetryingCaller::RetryingCaller(RetryPolicy policy, Sleeper sleeper, JitterSource jitter)
    : policy_(policy), sleeper_(std::move(sleeper)), jitter_(std::move(jitter)) {
    if (policy_.max_retries < 0) policy_.max_retries = 0;
    if (!sleeper_) sleeper_ = real_sleeper();
    if (!jitter_) jitter_ = uniform_jitter();
}

void RetryingCaller::begin_call() {
    state_ = RetryState::IDLE;
    attempts_ = 0;
    total_wait_ = 0.0;
}

bool RetryingCaller::should_retry(const std::string& message) const {
    if (!is_rate_limit_message(message)) return false;
    if (attempts_ > policy_.max_retries) {
        spdlog::error("🚫 Rate limit persisted after {} retries: {}", policy_.max_retries, message);
        return false;
    }
    return true;
}

void RetryingCaller::wait_before_retry() {
    transition(RetryState::WAITING);
    double secs = backoff_seconds(policy_, attempts_, jitter_());
    total_wait_ += secs;
    spdlog::warn("⏳ Rate limited. Retrying in {:.2f}s (retry {}/{})", secs, attempts_, policy_.max_retries);
    sleeper_(std::chrono::duration<double>(secs));
}

}
