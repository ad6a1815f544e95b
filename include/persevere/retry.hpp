// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_RETRY_HPP
#define PERSEVERE_RETRY_HPP

#include "config.hpp"
#include "cancellation.hpp"
#include "delay.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "task.hpp"
#include "timer.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace persevere {

// ============================================================================
// Backoff strategies
// ============================================================================

// Delay to wait after attempt `attempt` (1-based) timed out
using BackoffFunction = std::function<std::chrono::milliseconds(int attempt)>;

inline BackoffFunction linear_backoff(
    std::chrono::milliseconds step = std::chrono::milliseconds{PERSEVERE_DEFAULT_BACKOFF_STEP_MS}) {
    return [step](int attempt) {
        return step * attempt;
    };
}

// initial * factor^(attempt - 1), capped at `max`
inline BackoffFunction exponential_backoff(std::chrono::milliseconds initial, double factor,
                                           std::chrono::milliseconds max) {
    if (!std::isfinite(factor) || factor < 1.0) {
        throw InvalidPolicy("exponential backoff factor must be finite and at least 1, got " + std::to_string(factor));
    }
    if (initial < std::chrono::milliseconds::zero() || max < std::chrono::milliseconds::zero()) {
        throw InvalidPolicy("exponential backoff delays must not be negative");
    }
    return [initial, factor, max](int attempt) {
        double scaled = static_cast<double>(initial.count());
        for (int i = 1; i < attempt && scaled < static_cast<double>(max.count()); ++i) {
            scaled *= factor;
        }
        if (scaled >= static_cast<double>(max.count())) {
            return max;
        }
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(scaled)};
    };
}

inline BackoffFunction no_backoff() {
    return [](int) {
        return std::chrono::milliseconds{0};
    };
}

// ============================================================================
// RetryPolicy
// ============================================================================

struct RetryPolicy {
    int max_attempts = PERSEVERE_DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds attempt_timeout{PERSEVERE_DEFAULT_ATTEMPT_TIMEOUT_MS};
    BackoffFunction backoff = linear_backoff();

    PERSEVERE_NODISCARD RetryPolicy with_max_attempts(int attempts) const {
        auto copy = *this;
        copy.max_attempts = attempts;
        return copy;
    }

    template<typename Rep, typename Period>
    PERSEVERE_NODISCARD RetryPolicy with_attempt_timeout(std::chrono::duration<Rep, Period> timeout) const {
        auto copy = *this;
        copy.attempt_timeout = detail::saturating_ceil<std::chrono::milliseconds>(timeout);
        return copy;
    }

    PERSEVERE_NODISCARD RetryPolicy with_backoff(BackoffFunction function) const {
        auto copy = *this;
        copy.backoff = std::move(function);
        return copy;
    }

    void validate() const {
        if (max_attempts < 1) {
            throw InvalidPolicy("max_attempts must be at least 1, got " + std::to_string(max_attempts));
        }
        if (attempt_timeout <= std::chrono::milliseconds::zero()) {
            throw InvalidPolicy("attempt_timeout must be positive, got " +
                                std::to_string(attempt_timeout.count()) + "ms");
        }
        if (!backoff) {
            throw InvalidPolicy("backoff function is empty");
        }
    }
};

// ============================================================================
// Attempt reporting
// ============================================================================

enum class AttemptOutcome {
    Success,
    TimedOut,
    Cancelled,
    Failed,
};

inline std::string_view to_string(AttemptOutcome outcome) noexcept {
    switch (outcome) {
    case AttemptOutcome::Success:
        return "success";
    case AttemptOutcome::TimedOut:
        return "timed out";
    case AttemptOutcome::Cancelled:
        return "cancelled";
    case AttemptOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

struct AttemptEvent {
    int attempt;
    int max_attempts;
    AttemptOutcome outcome;
    std::chrono::milliseconds backoff;  // wait before the next attempt, zero if none follows
};

// Called once per attempt, after its outcome is known
using AttemptObserver = std::function<void(const AttemptEvent&)>;

// ============================================================================
// InvokeResult<T> - value, or the classified reason there is none
// ============================================================================

namespace detail {

struct InvokeFailure {
    ErrorKind kind;
    std::exception_ptr cause;
};

class InvokeResultBase {
public:
    PERSEVERE_NODISCARD int attempts() const noexcept {
        return attempts_;
    }

protected:
    explicit InvokeResultBase(int attempts) noexcept : attempts_(attempts) {}

    [[noreturn]] void throw_failure(const InvokeFailure& failure) const {
        throw InvocationError(failure.kind, static_cast<std::size_t>(attempts_), failure.cause);
    }

    int attempts_;
};

} // namespace detail

template<typename T>
class InvokeResult : public detail::InvokeResultBase {
public:
    static InvokeResult success(T value, int attempts) {
        return InvokeResult{std::in_place_index<0>, attempts, std::move(value)};
    }

    static InvokeResult failure(ErrorKind kind, int attempts, std::exception_ptr cause = nullptr) {
        return InvokeResult{std::in_place_index<1>, attempts, detail::InvokeFailure{kind, std::move(cause)}};
    }

    PERSEVERE_NODISCARD bool ok() const noexcept {
        return outcome_.index() == 0;
    }

    PERSEVERE_NODISCARD explicit operator bool() const noexcept {
        return ok();
    }

    // Empty when ok()
    PERSEVERE_NODISCARD std::optional<ErrorKind> error() const noexcept {
        if (ok()) {
            return std::nullopt;
        }
        return std::get<1>(outcome_).kind;
    }

    PERSEVERE_NODISCARD std::error_code error_code() const noexcept {
        if (ok()) {
            return {};
        }
        return make_error_code(std::get<1>(outcome_).kind);
    }

    // The operation's own exception for ErrorKind::Failed, null otherwise
    PERSEVERE_NODISCARD std::exception_ptr cause() const noexcept {
        if (ok()) {
            return nullptr;
        }
        return std::get<1>(outcome_).cause;
    }

    T& value() & {
        check();
        return std::get<0>(outcome_);
    }

    const T& value() const& {
        check();
        return std::get<0>(outcome_);
    }

    T&& value() && {
        check();
        return std::get<0>(std::move(outcome_));
    }

    // Rethrows the operation's exception if there is one, otherwise InvocationError
    void rethrow() const {
        if (ok()) {
            return;
        }
        const auto& failure = std::get<1>(outcome_);
        if (failure.cause) {
            std::rethrow_exception(failure.cause);
        }
        throw_failure(failure);
    }

private:
    template<std::size_t I, typename U>
    InvokeResult(std::in_place_index_t<I> index, int attempts, U&& payload)
        : InvokeResultBase(attempts)
        , outcome_(index, std::forward<U>(payload)) {}

    void check() const {
        if (!ok()) {
            throw_failure(std::get<1>(outcome_));
        }
    }

    std::variant<T, detail::InvokeFailure> outcome_;
};

template<>
class InvokeResult<void> : public detail::InvokeResultBase {
public:
    static InvokeResult success(int attempts) {
        return InvokeResult{attempts, std::nullopt};
    }

    static InvokeResult failure(ErrorKind kind, int attempts, std::exception_ptr cause = nullptr) {
        return InvokeResult{attempts, detail::InvokeFailure{kind, std::move(cause)}};
    }

    PERSEVERE_NODISCARD bool ok() const noexcept {
        return !failure_.has_value();
    }

    PERSEVERE_NODISCARD explicit operator bool() const noexcept {
        return ok();
    }

    PERSEVERE_NODISCARD std::optional<ErrorKind> error() const noexcept {
        if (ok()) {
            return std::nullopt;
        }
        return failure_->kind;
    }

    PERSEVERE_NODISCARD std::error_code error_code() const noexcept {
        if (ok()) {
            return {};
        }
        return make_error_code(failure_->kind);
    }

    PERSEVERE_NODISCARD std::exception_ptr cause() const noexcept {
        if (ok()) {
            return nullptr;
        }
        return failure_->cause;
    }

    void value() const {
        if (!ok()) {
            throw_failure(*failure_);
        }
    }

    void rethrow() const {
        if (ok()) {
            return;
        }
        if (failure_->cause) {
            std::rethrow_exception(failure_->cause);
        }
        throw_failure(*failure_);
    }

private:
    InvokeResult(int attempts, std::optional<detail::InvokeFailure> failure)
        : InvokeResultBase(attempts)
        , failure_(std::move(failure)) {}

    std::optional<detail::InvokeFailure> failure_;
};

// ============================================================================
// invoke - bounded retries on timeout, per-attempt deadline, caller cancellation
// ============================================================================

namespace detail {

inline const Logger& retry_logger() {
    static const Logger logger{"persevere.retry"};
    return logger;
}

// Operations either take the attempt's token or nothing at all
template<typename Operation>
auto start_attempt(Operation& operation, const CancellationToken& token) {
    if constexpr (std::is_invocable_v<Operation&, CancellationToken>) {
        return operation(token);
    } else {
        return operation();
    }
}

template<typename Operation>
using operation_task_t = decltype(start_attempt(std::declval<Operation&>(), std::declval<const CancellationToken&>()));

template<typename Operation>
using operation_value_t = typename operation_task_t<Operation>::value_type;

inline void notify(const AttemptObserver& observer, const AttemptEvent& event) {
    if (observer) {
        observer(event);
    }
}

template<typename T, typename Operation>
Task<InvokeResult<T>> run_attempts(Operation operation, RetryPolicy policy,
                                   CancellationToken cancellation, AttemptObserver observer) {
    const auto& log = retry_logger();
    const auto no_wait = std::chrono::milliseconds::zero();

    if (cancellation.is_cancellation_requested()) {
        PERSEVERE_LOG_INFO(log, "cancelled before the first attempt");
        co_return InvokeResult<T>::failure(ErrorKind::Cancelled, 0);
    }

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        PERSEVERE_LOG_DEBUG(log, "attempt {}/{} started", attempt, policy.max_attempts);

        std::optional<InvokeResult<T>> succeeded;
        std::exception_ptr error;
        bool cancellation_error = false;
        bool timeout_fired = false;

        {
            // Both sources are released when this scope ends, on every path
            CancellationSource timeout;
            timeout.cancel_after(policy.attempt_timeout);
            auto attempt_source = CancellationSource::linked(cancellation, timeout.token());

            try {
                if constexpr (std::is_void_v<T>) {
                    co_await start_attempt(operation, attempt_source.token());
                    succeeded.emplace(InvokeResult<T>::success(attempt));
                } else {
                    succeeded.emplace(InvokeResult<T>::success(
                        co_await start_attempt(operation, attempt_source.token()), attempt));
                }
            } catch (const OperationCancelled&) {
                error = std::current_exception();
                cancellation_error = true;
            } catch (...) {
                error = std::current_exception();
            }

            timeout_fired = timeout.is_cancellation_requested();
        }

        if (succeeded) {
            PERSEVERE_LOG_DEBUG(log, "attempt {}/{} succeeded", attempt, policy.max_attempts);
            notify(observer, {attempt, policy.max_attempts, AttemptOutcome::Success, no_wait});
            co_return std::move(*succeeded);
        }

        if (cancellation_error && cancellation.is_cancellation_requested()) {
            PERSEVERE_LOG_INFO(log, "attempt {}/{} cancelled by caller", attempt, policy.max_attempts);
            notify(observer, {attempt, policy.max_attempts, AttemptOutcome::Cancelled, no_wait});
            co_return InvokeResult<T>::failure(ErrorKind::Cancelled, attempt);
        }

        if (!cancellation_error || !timeout_fired) {
            PERSEVERE_LOG_WARN(log, "attempt {}/{} failed: {}", attempt, policy.max_attempts,
                               describe_exception(error));
            notify(observer, {attempt, policy.max_attempts, AttemptOutcome::Failed, no_wait});
            co_return InvokeResult<T>::failure(ErrorKind::Failed, attempt, error);
        }

        if (attempt == policy.max_attempts) {
            PERSEVERE_LOG_WARN(log, "attempt {}/{} timed out after {}ms, giving up", attempt,
                               policy.max_attempts, policy.attempt_timeout.count());
            notify(observer, {attempt, policy.max_attempts, AttemptOutcome::TimedOut, no_wait});
            co_return InvokeResult<T>::failure(ErrorKind::TimedOut, attempt);
        }

        auto pause = policy.backoff(attempt);
        PERSEVERE_LOG_INFO(log, "attempt {}/{} timed out after {}ms, retrying in {}ms", attempt,
                           policy.max_attempts, policy.attempt_timeout.count(), pause.count());
        notify(observer, {attempt, policy.max_attempts, AttemptOutcome::TimedOut, pause});

        bool interrupted = false;
        try {
            co_await delay(pause, cancellation);
        } catch (const OperationCancelled&) {
            interrupted = true;
        }

        if (interrupted) {
            PERSEVERE_LOG_INFO(log, "cancelled while backing off after attempt {}/{}", attempt,
                               policy.max_attempts);
            co_return InvokeResult<T>::failure(ErrorKind::Cancelled, attempt);
        }
    }

    co_return InvokeResult<T>::failure(ErrorKind::Failed, policy.max_attempts,
                                       std::make_exception_ptr(RetryExhausted(
                                           static_cast<std::size_t>(policy.max_attempts))));
}

} // namespace detail

// Run `operation` under `policy`. The operation is a callable returning
// Task<T>, taking either a CancellationToken (the attempt's composed token:
// caller cancellation OR attempt timeout) or nothing. Only timeouts are
// retried; caller cancellation and any other exception end the call at once.
// Throws InvalidPolicy immediately if the policy is unusable.
template<typename Operation, typename T = detail::operation_value_t<std::decay_t<Operation>>>
PERSEVERE_NODISCARD Task<InvokeResult<T>> invoke(Operation&& operation, RetryPolicy policy,
                                                 CancellationToken cancellation = {},
                                                 AttemptObserver observer = {}) {
    policy.validate();
    return detail::run_attempts<T>(std::decay_t<Operation>(std::forward<Operation>(operation)),
                                   std::move(policy), std::move(cancellation), std::move(observer));
}

template<typename Operation, typename Rep, typename Period,
         typename T = detail::operation_value_t<std::decay_t<Operation>>>
PERSEVERE_NODISCARD Task<InvokeResult<T>> invoke(Operation&& operation, int max_attempts,
                                                 std::chrono::duration<Rep, Period> attempt_timeout,
                                                 CancellationToken cancellation = {}) {
    auto policy = RetryPolicy{}.with_max_attempts(max_attempts).with_attempt_timeout(attempt_timeout);
    return invoke(std::forward<Operation>(operation), std::move(policy), std::move(cancellation));
}

// Blocking form for callers outside a coroutine
template<typename Operation, typename T = detail::operation_value_t<std::decay_t<Operation>>>
InvokeResult<T> invoke_sync(Operation&& operation, RetryPolicy policy,
                            CancellationToken cancellation = {}, AttemptObserver observer = {}) {
    return sync_wait(invoke(std::forward<Operation>(operation), std::move(policy),
                            std::move(cancellation), std::move(observer)));
}

} // namespace persevere

#endif // PERSEVERE_RETRY_HPP
