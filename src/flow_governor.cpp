#include "flow_governor.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <iostream>

namespace llmgate {

std::string to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

std::string to_string(AcquireStatus status) {
    switch (status) {
        case AcquireStatus::Ok: return "ok";
        case AcquireStatus::RateLimited: return "rate_limited";
        case AcquireStatus::CircuitOpen: return "circuit_open";
        case AcquireStatus::Timeout: return "timeout";
    }
    return "unknown";
}

std::string to_string(RateLimitReason reason) {
    switch (reason) {
        case RateLimitReason::None: return "none";
        case RateLimitReason::Requests: return "requests";
        case RateLimitReason::Tokens: return "tokens";
    }
    return "unknown";
}

// --- GovernedCall ---

GovernedCall::~GovernedCall() {
    abandon();
}

GovernedCall::GovernedCall(GovernedCall&& other) noexcept
    : governor_(std::exchange(other.governor_, nullptr))
    , result_(other.result_)
    , cost_(other.cost_)
{}

GovernedCall& GovernedCall::operator=(GovernedCall&& other) noexcept {
    if (this != &other) {
        abandon();
        governor_ = std::exchange(other.governor_, nullptr);
        result_ = other.result_;
        cost_ = other.cost_;
    }
    return *this;
}

void GovernedCall::succeed(uint64_t actual_cost) {
    finish(actual_cost, true);
}

void GovernedCall::fail(uint64_t actual_cost) {
    finish(actual_cost, false);
}

void GovernedCall::finish(uint64_t actual_cost, bool success) {
    if (FlowGovernor* governor = std::exchange(governor_, nullptr)) {
        governor->release(actual_cost, success);
    }
}

void GovernedCall::abandon() noexcept {
    try {
        finish(0, false);
    } catch (const std::exception& e) {
        // The slot and in-flight count are already returned; only the
        // outcome bookkeeping was lost.
        try {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::RELEASE_FAILED,
                             "governor", e.what());
        } catch (const std::exception&) {
            std::cerr << "[!] Governor release failed: " << e.what() << std::endl;
        }
    }
}

// --- FlowGovernor ---

FlowGovernor::FlowGovernor(const GovernorConfig& config, const Clock& clock)
    : config_(config)
    , clock_(clock)
    , slots_((validate_config(config), config.max_concurrent))
{
    state_.window_start_ms = clock_.now_ms();
    publish_gauges();
}

AcquireResult FlowGovernor::check_admission(uint64_t estimated_cost, int64_t now) {
    AcquireResult result;

    if (state_.circuit_state == CircuitState::Open) {
        int64_t elapsed = now - state_.circuit_opened_at_ms;
        if (elapsed < config_.recovery_timeout_ms) {
            result.status = AcquireStatus::CircuitOpen;
            result.retry_after_ms = config_.recovery_timeout_ms - elapsed;
            return result;
        }
        transition_to(CircuitState::HalfOpen, now);
    }

    // Fixed window: counters drop to zero once the window has fully elapsed.
    if (now - state_.window_start_ms > config_.window_duration_ms) {
        state_.requests_in_window = 0;
        state_.tokens_in_window = 0;
        state_.window_start_ms = now;
    }

    int64_t until_reset = config_.window_duration_ms - (now - state_.window_start_ms);

    if (state_.requests_in_window >= config_.requests_per_window) {
        result.status = AcquireStatus::RateLimited;
        result.reason = RateLimitReason::Requests;
        result.retry_after_ms = until_reset;
        return result;
    }

    // tokens_in_window <= tokens_per_window, so the subtraction cannot underflow.
    if (estimated_cost > config_.tokens_per_window - state_.tokens_in_window) {
        result.status = AcquireStatus::RateLimited;
        result.reason = RateLimitReason::Tokens;
        result.retry_after_ms = until_reset;
        return result;
    }

    return result;
}

AcquireResult FlowGovernor::commit(uint64_t estimated_cost) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    // Other callers may have consumed the budget or tripped the breaker while
    // this one waited for a slot.
    AcquireResult result = check_admission(estimated_cost, clock_.now_ms());
    if (!result.ok()) return result;

    state_.requests_in_window += 1;
    state_.tokens_in_window += estimated_cost;
    state_.in_flight += 1;
    MetricsRegistry::instance().increment_counter("governor_acquired_total");
    publish_gauges();
    return result;
}

namespace {

void note_rejection(const AcquireResult& result) {
    auto& metrics = MetricsRegistry::instance();
    if (result.status == AcquireStatus::CircuitOpen) {
        metrics.increment_counter("governor_circuit_rejected_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CIRCUIT_REJECTED,
                         "governor", "retry_after_ms=" + std::to_string(result.retry_after_ms));
    } else {
        metrics.increment_counter("governor_rate_limited_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::RATE_LIMITED,
                         "governor", "reason=" + to_string(result.reason) +
                         " retry_after_ms=" + std::to_string(result.retry_after_ms));
    }
}

}

AcquireResult FlowGovernor::acquire(uint64_t estimated_cost) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        AcquireResult result = check_admission(estimated_cost, clock_.now_ms());
        if (!result.ok()) {
            note_rejection(result);
            return result;
        }
    }

    // The only suspension point: never wait while holding state_mutex_.
    slots_.acquire();

    AcquireResult result = commit(estimated_cost);
    if (!result.ok()) {
        slots_.release();
        note_rejection(result);
    }
    return result;
}

AcquireResult FlowGovernor::acquire_for(uint64_t estimated_cost, std::chrono::milliseconds max_wait) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        AcquireResult result = check_admission(estimated_cost, clock_.now_ms());
        if (!result.ok()) {
            note_rejection(result);
            return result;
        }
    }

    if (!slots_.try_acquire_for(max_wait)) {
        MetricsRegistry::instance().increment_counter("governor_slot_timeout_total");
        AcquireResult timed_out;
        timed_out.status = AcquireStatus::Timeout;
        return timed_out;
    }

    AcquireResult result = commit(estimated_cost);
    if (!result.ok()) {
        slots_.release();
        note_rejection(result);
    }
    return result;
}

void FlowGovernor::release(uint64_t /*actual_cost*/, bool success) {
    slots_.release();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.in_flight > 0) state_.in_flight -= 1;

    int64_t now = clock_.now_ms();
    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("governor_released_total");

    if (success) {
        state_.consecutive_successes += 1;
        state_.consecutive_failures = 0;
        if (state_.circuit_state == CircuitState::HalfOpen &&
            state_.consecutive_successes >= config_.success_threshold) {
            transition_to(CircuitState::Closed, now);
        }
    } else {
        metrics.increment_counter("governor_failures_total");
        state_.consecutive_failures += 1;
        state_.consecutive_successes = 0;
        if (state_.consecutive_failures >= config_.failure_threshold) {
            transition_to(CircuitState::Open, now);
        }
    }
    publish_gauges();
}

GovernedCall FlowGovernor::try_enter(uint64_t estimated_cost) {
    AcquireResult result = acquire(estimated_cost);
    if (!result.ok()) return GovernedCall(nullptr, result, estimated_cost);
    return GovernedCall(this, result, estimated_cost);
}

GovernedCall FlowGovernor::try_enter_for(uint64_t estimated_cost, std::chrono::milliseconds max_wait) {
    AcquireResult result = acquire_for(estimated_cost, max_wait);
    if (!result.ok()) return GovernedCall(nullptr, result, estimated_cost);
    return GovernedCall(this, result, estimated_cost);
}

GovernorState FlowGovernor::metrics() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

int64_t FlowGovernor::reset_time() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    int64_t elapsed = clock_.now_ms() - state_.window_start_ms;
    return std::max<int64_t>(0, config_.window_duration_ms - elapsed);
}

void FlowGovernor::force_circuit_state(CircuitState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    int64_t now = clock_.now_ms();

    EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CIRCUIT_FORCED,
                     "governor", to_string(state_.circuit_state) + " -> " + to_string(state));

    if (state == CircuitState::Closed) {
        state_.consecutive_failures = 0;
        state_.consecutive_successes = 0;
    }
    transition_to(state, now);
    publish_gauges();
}

// Caller holds state_mutex_.
void FlowGovernor::transition_to(CircuitState next, int64_t now) {
    CircuitState previous = state_.circuit_state;
    state_.circuit_state = next;

    if (next == CircuitState::Open) {
        state_.circuit_opened_at_ms = now;
    }
    if (previous == next) return;

    switch (next) {
        case CircuitState::Open:
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::CIRCUIT_OPENED, "governor",
                             "consecutive_failures=" + std::to_string(state_.consecutive_failures));
            break;
        case CircuitState::HalfOpen:
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::CIRCUIT_HALF_OPEN, "governor",
                             "recovery timeout elapsed, admitting probes");
            break;
        case CircuitState::Closed:
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::CIRCUIT_CLOSED, "governor",
                             "consecutive_successes=" + std::to_string(state_.consecutive_successes));
            break;
    }
    publish_gauges();
}

// Caller holds state_mutex_ (or is the constructor).
void FlowGovernor::publish_gauges() {
    auto& metrics = MetricsRegistry::instance();
    metrics.set_gauge("governor_in_flight", static_cast<double>(state_.in_flight));
    metrics.set_gauge("governor_circuit_state", static_cast<double>(static_cast<int>(state_.circuit_state)));
}

}
