#include "voice_orchestrator/resilience/resilient_invoker.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

#include "voice_orchestrator/logging.hpp"
#include "voice_orchestrator/metrics.hpp"
#include "voice_orchestrator/utils/text.hpp"

namespace voice_orchestrator {

namespace {

std::string describe(InvokeError::Kind kind,
                     const std::string& operation,
                     const std::string& last_error) {
    switch (kind) {
        case InvokeError::Kind::NonRetryable:
            return "[" + operation + "] non-retryable error: " + last_error;
        case InvokeError::Kind::CircuitOpen:
            return "[" + operation + "] circuit breaker open; last error: " + last_error;
        case InvokeError::Kind::Exhausted:
            return "[" + operation + "] operation failed after all attempts; last error: " +
                   last_error;
    }
    return "[" + operation + "] " + last_error;
}

ResilientInvoker::JitterSource default_jitter() {
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    auto engine_mutex = std::make_shared<std::mutex>();
    return [engine, engine_mutex]() {
        std::uniform_real_distribution<double> distribution(0.5, 1.0);
        std::lock_guard<std::mutex> lock(*engine_mutex);
        return distribution(*engine);
    };
}

}

InvokeError::InvokeError(Kind kind, std::string operation, std::string last_error)
    : std::runtime_error(describe(kind, operation, last_error)),
      kind_(kind),
      operation_(std::move(operation)),
      last_error_(std::move(last_error)) {}

const char* to_string(InvokeError::Kind kind) {
    switch (kind) {
        case InvokeError::Kind::NonRetryable:
            return "non_retryable";
        case InvokeError::Kind::CircuitOpen:
            return "circuit_open";
        case InvokeError::Kind::Exhausted:
            return "exhausted";
    }
    return "unknown";
}

ResilientInvoker::ResilientInvoker(std::string name,
                                   RetryConfig config,
                                   std::shared_ptr<utils::Clock> clock,
                                   Sleeper sleeper,
                                   JitterSource jitter)
    : name_(std::move(name)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)),
      jitter_(std::move(jitter)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    if (!jitter_) {
        jitter_ = default_jitter();
    }
}

bool ResilientInvoker::is_retryable(const std::exception& ex) const {
    const std::string message = ex.what();
    return std::any_of(config_.retryable_error_markers.begin(),
                       config_.retryable_error_markers.end(),
                       [&message](const std::string& marker) {
                           return utils::contains_ignore_case(message, marker);
                       });
}

double ResilientInvoker::base_delay_ms(int attempt) const {
    const double exponential = static_cast<double>(config_.initial_delay_ms) *
                               std::pow(config_.backoff_multiplier, std::max(0, attempt - 1));
    return std::min(exponential, static_cast<double>(config_.max_delay_ms));
}

std::chrono::milliseconds ResilientInvoker::delay_for(int attempt) const {
    const double jitter = std::clamp(jitter_(), 0.5, 1.0);
    const double exponential = static_cast<double>(config_.initial_delay_ms) *
                               std::pow(config_.backoff_multiplier, std::max(0, attempt - 1));
    const double delay = std::min(exponential * jitter, static_cast<double>(config_.max_delay_ms));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

CircuitStatus ResilientInvoker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitStatus status;
    status.state = state_;
    status.consecutive_failures = consecutive_failures_;
    if (state_ == CircuitState::Open && opened_at_ &&
        clock_->now() - *opened_at_ >=
            std::chrono::milliseconds(config_.circuit_breaker_timeout_ms)) {
        status.state = CircuitState::HalfOpen;
    }
    return status;
}

void ResilientInvoker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    half_open_in_flight_ = false;
    consecutive_failures_ = 0;
    opened_at_.reset();
    last_error_.clear();
}

void ResilientInvoker::before_attempt(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::Closed) {
        return;
    }
    if (state_ == CircuitState::HalfOpen) {
        if (half_open_in_flight_) {
            throw InvokeError(InvokeError::Kind::CircuitOpen, operation, last_error_);
        }
        half_open_in_flight_ = true;
        return;
    }
    const auto elapsed = clock_->now() - opened_at_.value_or(clock_->now());
    if (elapsed >= std::chrono::milliseconds(config_.circuit_breaker_timeout_ms)) {
        state_ = CircuitState::HalfOpen;
        half_open_in_flight_ = true;
        logging::info(
            "Circuit breaker half-open",
            {kv("invoker", name_),
             kv("operation", operation)});
        return;
    }
    throw InvokeError(InvokeError::Kind::CircuitOpen, operation, last_error_);
}

void ResilientInvoker::on_success(const std::string& operation, int attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Closed) {
        logging::info(
            "Circuit breaker closed",
            {kv("invoker", name_),
             kv("operation", operation)});
    }
    state_ = CircuitState::Closed;
    half_open_in_flight_ = false;
    consecutive_failures_ = 0;
    opened_at_.reset();
    if (attempt > 1) {
        logging::debug(
            "Operation succeeded after retry",
            {kv("invoker", name_),
             kv("operation", operation),
             kv("attempt", attempt)});
    }
}

void ResilientInvoker::on_failure(const std::string& operation,
                                  int attempt,
                                  const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++consecutive_failures_;
    last_error_ = error;
    logging::warn(
        "Operation attempt failed",
        {kv("invoker", name_),
         kv("operation", operation),
         kv("attempt", attempt),
         kv("consecutive_failures", consecutive_failures_),
         kv("error", error)});

    const bool reopen = state_ == CircuitState::HalfOpen;
    half_open_in_flight_ = false;
    if (reopen || (state_ == CircuitState::Closed &&
                   consecutive_failures_ >= config_.circuit_breaker_threshold)) {
        state_ = CircuitState::Open;
        opened_at_ = clock_->now();
        ServiceMetrics::instance().increment_circuit_open(name_);
        logging::warn(
            reopen ? "Circuit breaker re-opened" : "Circuit breaker opened",
            {kv("invoker", name_),
             kv("operation", operation),
             kv("consecutive_failures", consecutive_failures_),
             kv("timeout_ms", config_.circuit_breaker_timeout_ms)});
    }
}

void ResilientInvoker::sleep_before_retry(const std::string& operation, int attempt) {
    const auto delay = delay_for(attempt);
    logging::debug(
        "Retrying operation",
        {kv("invoker", name_),
         kv("operation", operation),
         kv("next_attempt", attempt + 1),
         kv("delay_ms", delay.count())});
    sleeper_(delay);
}

}
