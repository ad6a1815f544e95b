// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_DELAY_HPP
#define PERSEVERE_DELAY_HPP

#include "config.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "timer.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace persevere {

namespace detail {

// Shared between the awaiter, its timer and its cancellation callback.
// Whichever of timer/cancellation claims it first decides the outcome.
struct DelayState {
    enum Phase : int {
        Arming,
        Suspended,
        Done,
    };

    std::atomic<bool> claimed{false};
    std::atomic<int> phase{Arming};
    bool cancelled{false};
    coroutine_handle<> continuation{nullptr};
    ThreadPool* executor{nullptr};

    void complete(bool by_cancellation) {
        if (claimed.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        cancelled = by_cancellation;
        // Still arming: await_suspend sees Done and does not suspend
        if (phase.exchange(Done, std::memory_order_acq_rel) != Suspended) {
            return;
        }
        if (!executor->schedule(continuation)) {
            continuation.resume();
        }
    }
};

} // namespace detail

// ============================================================================
// DelayAwaiter - cancellable sleep for coroutines
// ============================================================================
//
// Throws OperationCancelled from co_await if the token is cancelled before or
// during the wait. The coroutine resumes on `executor` either way.

class DelayAwaiter {
public:
    using Clock = TimerService::Clock;

    DelayAwaiter(Clock::duration duration, CancellationToken token, TimerService& timers, ThreadPool& executor)
        : duration_(duration)
        , token_(std::move(token))
        , timers_(timers)
        , executor_(executor) {}

    bool await_ready() const noexcept {
        return duration_ <= Clock::duration::zero() || token_.is_cancellation_requested();
    }

    bool await_suspend(coroutine_handle<> awaiting) {
        state_ = std::make_shared<detail::DelayState>();
        state_->continuation = awaiting;
        state_->executor = &executor_;

        registration_ = token_.register_callback([state = state_] { state->complete(true); });
        timer_ = timers_.schedule_after(duration_, [state = state_] { state->complete(false); });

        int expected = detail::DelayState::Arming;
        return state_->phase.compare_exchange_strong(
            expected, detail::DelayState::Suspended, std::memory_order_acq_rel);
    }

    void await_resume() {
        timer_.cancel();
        registration_.reset();

        bool cancelled = state_ ? state_->cancelled : token_.is_cancellation_requested();
        if (cancelled) {
            throw OperationCancelled("delay cancelled");
        }
    }

private:
    Clock::duration duration_;
    CancellationToken token_;
    TimerService& timers_;
    ThreadPool& executor_;
    std::shared_ptr<detail::DelayState> state_;
    CancellationRegistration registration_;
    TimerHandle timer_;
};

// co_await delay(100ms, token);
template<typename Rep, typename Period>
DelayAwaiter delay(std::chrono::duration<Rep, Period> duration,
                   CancellationToken token = {},
                   TimerService& timers = global_timer(),
                   ThreadPool& executor = global_pool()) {
    return DelayAwaiter{detail::saturating_ceil<DelayAwaiter::Clock::duration>(duration),
                        std::move(token), timers, executor};
}

} // namespace persevere

#endif // PERSEVERE_DELAY_HPP
