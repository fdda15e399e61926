#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "voice_orchestrator/config.hpp"
#include "voice_orchestrator/utils/clock.hpp"

namespace voice_orchestrator {

class InvokeError : public std::runtime_error {
public:
    enum class Kind {
        NonRetryable,
        CircuitOpen,
        Exhausted
    };

    InvokeError(Kind kind, std::string operation, std::string last_error);

    Kind kind() const { return kind_; }
    const std::string& operation() const { return operation_; }
    const std::string& last_error() const { return last_error_; }

private:
    Kind kind_;
    std::string operation_;
    std::string last_error_;
};

const char* to_string(InvokeError::Kind kind);

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

struct CircuitStatus {
    CircuitState state = CircuitState::Closed;
    int consecutive_failures = 0;
};

/**
 * Retry with exponential backoff and jitter behind a circuit breaker.
 *
 * One instance guards one class of outbound operation (retrieval,
 * generation, persistence) and is shared by every call; the breaker state is
 * the only mutable state and is guarded by a mutex.
 *
 * `max_retries` is the total number of attempts made by one invoke().
 * After `circuit_breaker_threshold` consecutive failed attempts the breaker
 * opens and every attempt fails fast with Kind::CircuitOpen until
 * `circuit_breaker_timeout_ms` has elapsed; the next attempt then runs in
 * half-open state: success closes the breaker, failure re-opens it. Only one
 * half-open trial runs at a time; concurrent attempts fail fast meanwhile.
 */
class ResilientInvoker {
public:
    using RetryPredicate = std::function<bool(const std::exception&)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    // Returns a jitter factor in [0.5, 1.0].
    using JitterSource = std::function<double()>;

    ResilientInvoker(std::string name,
                     RetryConfig config,
                     std::shared_ptr<utils::Clock> clock = utils::SystemClock::shared(),
                     Sleeper sleeper = {},
                     JitterSource jitter = {});

    template <typename Fn>
    std::invoke_result_t<Fn&> invoke(const std::string& operation,
                                     Fn&& fn,
                                     const RetryPredicate& is_retryable);

    // Retries errors whose message contains one of the configured markers.
    template <typename Fn>
    std::invoke_result_t<Fn&> invoke(const std::string& operation, Fn&& fn) {
        return invoke(operation, std::forward<Fn>(fn),
                      [this](const std::exception& ex) { return is_retryable(ex); });
    }

    bool is_retryable(const std::exception& ex) const;
    // min(max_delay_ms, initial_delay_ms * multiplier^(attempt - 1)), before jitter.
    double base_delay_ms(int attempt) const;
    std::chrono::milliseconds delay_for(int attempt) const;

    CircuitStatus status() const;
    void reset();
    const std::string& name() const { return name_; }
    const RetryConfig& config() const { return config_; }

private:
    void before_attempt(const std::string& operation);
    void on_success(const std::string& operation, int attempt);
    void on_failure(const std::string& operation, int attempt, const std::string& error);
    void sleep_before_retry(const std::string& operation, int attempt);

    std::string name_;
    RetryConfig config_;
    std::shared_ptr<utils::Clock> clock_;
    Sleeper sleeper_;
    JitterSource jitter_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    bool half_open_in_flight_ = false;
    int consecutive_failures_ = 0;
    std::optional<utils::Clock::TimePoint> opened_at_;
    std::string last_error_;
};

template <typename Fn>
std::invoke_result_t<Fn&> ResilientInvoker::invoke(const std::string& operation,
                                                   Fn&& fn,
                                                   const RetryPredicate& is_retryable) {
    for (int attempt = 1;; ++attempt) {
        before_attempt(operation);
        std::string error;
        bool retryable = false;
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
                fn();
                on_success(operation, attempt);
                return;
            } else {
                auto result = fn();
                on_success(operation, attempt);
                return result;
            }
        } catch (const std::exception& ex) {
            error = ex.what();
            retryable = is_retryable ? is_retryable(ex) : false;
        }

        on_failure(operation, attempt, error);
        if (!retryable) {
            throw InvokeError(InvokeError::Kind::NonRetryable, operation, error);
        }
        if (attempt >= config_.max_retries) {
            throw InvokeError(InvokeError::Kind::Exhausted, operation, error);
        }
        sleep_before_retry(operation, attempt);
    }
}

}
