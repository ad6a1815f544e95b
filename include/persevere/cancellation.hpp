// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_CANCELLATION_HPP
#define PERSEVERE_CANCELLATION_HPP

#include "config.hpp"
#include "errors.hpp"
#include "timer.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace persevere {

namespace detail {
class CancellationState;
}

// ============================================================================
// CancellationRegistration - unregisters its callback when dropped
// ============================================================================

class CancellationRegistration {
public:
    CancellationRegistration() noexcept = default;

    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id) noexcept
        : state_(std::move(state))
        , id_(id) {}

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_))
        , id_(std::exchange(other.id_, 0)) {}

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    ~CancellationRegistration() {
        reset();
    }

    // Removes the callback if it has not started. A callback already running
    // on the cancelling thread is not waited for.
    void reset() noexcept;

    PERSEVERE_NODISCARD bool active() const noexcept {
        return id_ != 0;
    }

private:
    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

namespace detail {

class CancellationState {
public:
    using Callback = std::function<void()>;

    CancellationState() = default;

    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Returns 0 when already cancelled; the callback has then run inline
    std::uint64_t add_callback(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_relaxed)) {
                auto id = next_id_++;
                callbacks_.emplace_back(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove_callback(std::uint64_t id) noexcept {
        Callback removed;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == id) {
                removed = std::move(it->second);
                callbacks_.erase(it);
                break;
            }
        }
    }

    // Runs every callback once, in registration order, on the calling thread.
    // The first exception a callback throws is rethrown after all have run.
    bool request_cancellation() {
        std::vector<std::pair<std::uint64_t, Callback>> to_run;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed)) {
                return false;
            }
            cancelled_.store(true, std::memory_order_release);
            to_run.swap(callbacks_);
        }

        std::exception_ptr first_error;
        for (auto& entry : to_run) {
            try {
                entry.second();
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return true;
    }

    void link(CancellationRegistration parent) {
        std::lock_guard<std::mutex> lock(mutex_);
        links_.push_back(std::move(parent));
    }

    void arm(TimerHandle timer) {
        TimerHandle previous;
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(timer_, std::move(timer));
    }

    // Detach from parents and disarm the timer; observed state stays as is
    void release() noexcept {
        std::vector<CancellationRegistration> links;
        TimerHandle timer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            links.swap(links_);
            timer = std::move(timer_);
        }
    }

private:
    mutable std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    std::uint64_t next_id_{1};
    std::vector<std::pair<std::uint64_t, Callback>> callbacks_;
    std::vector<CancellationRegistration> links_;
    TimerHandle timer_;
};

} // namespace detail

inline void CancellationRegistration::reset() noexcept {
    if (id_ == 0) {
        return;
    }
    auto id = std::exchange(id_, 0);
    if (auto state = state_.lock()) {
        state->remove_callback(id);
    }
    state_.reset();
}

// ============================================================================
// CancellationToken - observer side of a cancellation signal
// ============================================================================

class CancellationToken {
public:
    // A token that is never cancelled
    CancellationToken() noexcept = default;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) noexcept
        : state_(std::move(state)) {}

    PERSEVERE_NODISCARD bool can_be_cancelled() const noexcept {
        return state_ != nullptr;
    }

    PERSEVERE_NODISCARD bool is_cancellation_requested() const noexcept {
        return state_ && state_->is_cancelled();
    }

    void throw_if_cancellation_requested() const {
        if (is_cancellation_requested()) {
            throw OperationCancelled();
        }
    }

    // Runs `callback` once when cancellation is requested, on the cancelling
    // thread. If the token is already cancelled it runs before this returns.
    template<typename F>
    PERSEVERE_NODISCARD CancellationRegistration register_callback(F&& callback) const {
        if (!state_) {
            return {};
        }
        auto id = state_->add_callback(std::function<void()>(std::forward<F>(callback)));
        if (id == 0) {
            return {};
        }
        return CancellationRegistration{state_, id};
    }

    friend bool operator==(const CancellationToken& a, const CancellationToken& b) noexcept {
        return a.state_ == b.state_;
    }

private:
    friend class CancellationSource;

    std::shared_ptr<detail::CancellationState> state_;
};

// ============================================================================
// CancellationSource - owner side; cancels the tokens it hands out
// ============================================================================
//
// Destroying a source does not cancel it. It unlinks it from its parents and
// disarms a pending cancel_after, so tokens still held elsewhere keep their
// last observed state.

class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationSource(CancellationSource&& other) noexcept = default;

    CancellationSource& operator=(CancellationSource&& other) noexcept {
        if (this != &other) {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    ~CancellationSource() {
        release();
    }

    // A source cancelled as soon as any of `parents` is
    static CancellationSource linked(const std::vector<CancellationToken>& parents) {
        CancellationSource source;
        std::weak_ptr<detail::CancellationState> child = source.state_;

        for (const auto& parent : parents) {
            if (!parent.can_be_cancelled()) {
                continue;
            }
            auto registration = parent.register_callback([child] {
                if (auto state = child.lock()) {
                    state->request_cancellation();
                }
            });
            if (source.is_cancellation_requested()) {
                break;
            }
            source.state_->link(std::move(registration));
        }
        return source;
    }

    static CancellationSource linked(const CancellationToken& first, const CancellationToken& second) {
        return linked(std::vector<CancellationToken>{first, second});
    }

    PERSEVERE_NODISCARD CancellationToken token() const noexcept {
        return CancellationToken{state_};
    }

    // Idempotent. Returns true for the call that performed the cancellation.
    bool cancel() {
        auto state = state_;
        return state && state->request_cancellation();
    }

    // Cancel once `delay` elapses. Re-arming replaces the previous timer.
    template<typename Rep, typename Period>
    void cancel_after(std::chrono::duration<Rep, Period> delay, TimerService& timers = global_timer()) {
        if (!state_ || state_->is_cancelled()) {
            return;
        }
        std::weak_ptr<detail::CancellationState> target = state_;
        state_->arm(timers.schedule_after(delay, [target] {
            if (auto state = target.lock()) {
                state->request_cancellation();
            }
        }));
    }

    PERSEVERE_NODISCARD bool is_cancellation_requested() const noexcept {
        return state_ && state_->is_cancelled();
    }

private:
    void release() noexcept {
        if (state_) {
            state_->release();
        }
    }

    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace persevere

#endif // PERSEVERE_CANCELLATION_HPP
