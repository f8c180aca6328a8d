#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>

#include "clock.hpp"
#include "gate_config.hpp"
#include "slot_semaphore.hpp"

namespace llmgate {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

enum class AcquireStatus {
    Ok,
    RateLimited,
    CircuitOpen,
    Timeout     // Only from the deadline-bounded variants, while waiting for a slot
};

enum class RateLimitReason {
    None,
    Requests,
    Tokens
};

std::string to_string(CircuitState state);
std::string to_string(AcquireStatus status);
std::string to_string(RateLimitReason reason);

// Outcome of an admission attempt. Rejections carry a retry hint; nothing here
// ever sleeps on the caller's behalf.
struct AcquireResult {
    AcquireStatus status = AcquireStatus::Ok;
    RateLimitReason reason = RateLimitReason::None;
    int64_t retry_after_ms = 0;

    bool ok() const { return status == AcquireStatus::Ok; }
};

// Point-in-time copy of the governor's counters.
struct GovernorState {
    uint64_t requests_in_window = 0;
    uint64_t tokens_in_window = 0;
    int64_t window_start_ms = 0;
    CircuitState circuit_state = CircuitState::Closed;
    uint32_t consecutive_failures = 0;
    uint32_t consecutive_successes = 0;
    int64_t circuit_opened_at_ms = 0;
    uint32_t in_flight = 0;
};

class FlowGovernor;

// Scoped permit for one governed call. Releasing is guaranteed: if neither
// succeed() nor fail() ran before destruction (early return, exception), the
// call is recorded as a failure.
class GovernedCall {
public:
    GovernedCall() = default;
    ~GovernedCall();

    GovernedCall(GovernedCall&& other) noexcept;
    GovernedCall& operator=(GovernedCall&& other) noexcept;

    GovernedCall(const GovernedCall&) = delete;
    GovernedCall& operator=(const GovernedCall&) = delete;

    // True while the permit is held.
    explicit operator bool() const { return governor_ != nullptr; }

    // The admission result; inspect it when the permit was refused.
    const AcquireResult& result() const { return result_; }

    void succeed(uint64_t actual_cost);
    void fail(uint64_t actual_cost);

private:
    friend class FlowGovernor;
    GovernedCall(FlowGovernor* governor, AcquireResult result, uint64_t cost)
        : governor_(governor), result_(result), cost_(cost) {}

    void finish(uint64_t actual_cost, bool success);
    // finish(0, false) for the destructor and move assignment; never throws.
    void abandon() noexcept;

    FlowGovernor* governor_ = nullptr;
    AcquireResult result_;
    uint64_t cost_ = 0;
};

// Admission control for calls to the external model provider: fixed-window
// request and token budgets, a concurrency gate and a circuit breaker.
// One instance per process; all state changes happen under state_mutex_.
class FlowGovernor {
public:
    FlowGovernor(const GovernorConfig& config, const Clock& clock);
    ~FlowGovernor() = default;

    FlowGovernor(const FlowGovernor&) = delete;
    FlowGovernor& operator=(const FlowGovernor&) = delete;

    /**
     * Requests admission for one call.
     * Circuit and window checks fail fast; the call blocks only while every
     * concurrency slot is taken.
     * @param estimated_cost Tokens the call is expected to consume.
     * @return Ok, or a rejection with a retry hint. Every Ok must be matched
     *         by exactly one release().
     */
    AcquireResult acquire(uint64_t estimated_cost);

    // Like acquire(), but gives up with AcquireStatus::Timeout if no slot
    // frees up within max_wait. A timed-out attempt holds nothing.
    AcquireResult acquire_for(uint64_t estimated_cost, std::chrono::milliseconds max_wait);

    /**
     * Returns the concurrency slot and records the call outcome.
     * @param actual_cost Tokens actually consumed (the window keeps the estimate).
     * @param success Whether the external call succeeded.
     */
    void release(uint64_t actual_cost, bool success);

    // RAII entry points. The returned permit is empty when admission failed.
    GovernedCall try_enter(uint64_t estimated_cost);
    GovernedCall try_enter_for(uint64_t estimated_cost, std::chrono::milliseconds max_wait);

    GovernorState metrics() const;

    // Milliseconds until the current window rolls over, never negative.
    int64_t reset_time() const;

    // Administrative override. Forcing Closed clears both streak counters;
    // forcing Open restarts the recovery timeout.
    void force_circuit_state(CircuitState state);

    const GovernorConfig& config() const { return config_; }

private:
    // Steps 1-4 of admission. Caller holds state_mutex_.
    AcquireResult check_admission(uint64_t estimated_cost, int64_t now);

    // Re-checks and books the call once a slot is held.
    AcquireResult commit(uint64_t estimated_cost);

    void transition_to(CircuitState next, int64_t now);
    void publish_gauges();

    const GovernorConfig config_;
    const Clock& clock_;

    mutable std::mutex state_mutex_;
    GovernorState state_;
    SlotSemaphore slots_;
};

/**
 * Runs `fn` as one governed call.
 * Returns the rejection without invoking `fn` when admission fails. A normal
 * return from `fn` is recorded as a success; an exception is recorded as a
 * failure and rethrown.
 */
template <class Fn>
AcquireResult with_governance(FlowGovernor& governor, uint64_t estimated_cost, Fn&& fn) {
    GovernedCall call = governor.try_enter(estimated_cost);
    if (!call) return call.result();

    std::forward<Fn>(fn)();
    call.succeed(estimated_cost);
    return call.result();
}

}
