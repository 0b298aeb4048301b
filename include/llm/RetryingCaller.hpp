#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace code_interpreter {

struct RetryPolicy {
    int max_retries = 5;
    double min_wait_seconds = 1.0;
    double max_wait_seconds = 60.0;
};

enum class RetryState {
    IDLE,
    CALLING,
    WAITING,
    SUCCEEDED,
    FAILED
};

const char* to_string(RetryState state);

// Case-insensitive "too many requests" or "429" at the very start of the
// message. A message that only mentions 429 later on does not match.
bool is_rate_limit_message(const std::string& message);

// min(min_wait * 2^(attempt-1), max_wait) plus jitter_fraction * 10% of that.
// `attempt` counts from 1; `jitter_fraction` is in [0, 1].
double backoff_seconds(const RetryPolicy& policy, int attempt, double jitter_fraction);

using Sleeper = std::function<void(std::chrono::duration<double>)>;
using JitterSource = std::function<double()>;

Sleeper real_sleeper();
JitterSource uniform_jitter();

// Retries one upstream call while it fails with a rate-limit message.
// Every other error propagates on first sight. After max_retries retries the
// last rate-limit error is rethrown unchanged.
class RetryingCaller {
public:
    explicit RetryingCaller(RetryPolicy policy = {}, Sleeper sleeper = real_sleeper(),
                            JitterSource jitter = uniform_jitter());

    template <typename Fn>
    auto call(Fn&& fn) -> std::invoke_result_t<Fn&> {
        begin_call();
        while (true) {
            transition(RetryState::CALLING);
            ++attempts_;
            try {
                if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
                    fn();
                    transition(RetryState::SUCCEEDED);
                    return;
                } else {
                    auto result = fn();
                    transition(RetryState::SUCCEEDED);
                    return result;
                }
            } catch (const std::exception& e) {
                if (!should_retry(e.what())) {
                    transition(RetryState::FAILED);
                    throw;
                }
            }
            wait_before_retry();
        }
    }

    const RetryPolicy& policy() const { return policy_; }

    // Bookkeeping for the most recent call() only.
    RetryState state() const { return state_; }
    int attempts() const { return attempts_; }
    double total_wait_seconds() const { return total_wait_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    JitterSource jitter_;

    RetryState state_ = RetryState::IDLE;
    int attempts_ = 0;
    double total_wait_ = 0.0;

    void begin_call();
    void transition(RetryState next) { state_ = next; }
    bool should_retry(const std::string& message) const;
    void wait_before_retry();
};

}
