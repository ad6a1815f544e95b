// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_TASK_HPP
#define PERSEVERE_TASK_HPP

#include "config.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

namespace persevere {

template<typename T = void>
class Task;

namespace detail {

// Value-or-exception slot shared by task promises and sync_wait
template<typename T>
class ResultSlot {
public:
    template<typename U>
    void set_value(U&& value) {
        state_.template emplace<1>(std::forward<U>(value));
    }

    void set_exception(std::exception_ptr error) noexcept {
        state_.template emplace<2>(std::move(error));
    }

    T& get() & {
        rethrow_if_failed();
        return std::get<1>(state_);
    }

    T take() {
        rethrow_if_failed();
        return std::move(std::get<1>(state_));
    }

private:
    void rethrow_if_failed() const {
        if (state_.index() == 2) {
            std::rethrow_exception(std::get<2>(state_));
        }
    }

    std::variant<std::monostate, T, std::exception_ptr> state_;
};

template<>
class ResultSlot<void> {
public:
    void set_value() noexcept {}

    void set_exception(std::exception_ptr error) noexcept {
        error_ = std::move(error);
    }

    void get() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

    void take() const {
        get();
    }

private:
    std::exception_ptr error_;
};

// Lazy start, symmetric transfer to the awaiting coroutine on completion
class PromiseBase {
public:
    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }

        template<typename Promise>
        coroutine_handle<> await_suspend(coroutine_handle<Promise> finished) noexcept {
            auto continuation = finished.promise().continuation();
            if (continuation) {
                return continuation;
            }
            return noop_coroutine();
        }

        void await_resume() const noexcept {}
    };

    suspend_always initial_suspend() const noexcept { return {}; }

    FinalAwaiter final_suspend() const noexcept { return {}; }

    void set_continuation(coroutine_handle<> continuation) noexcept {
        continuation_ = continuation;
    }

    coroutine_handle<> continuation() const noexcept {
        return continuation_;
    }

private:
    coroutine_handle<> continuation_{nullptr};
};

template<typename T>
class TaskPromise : public PromiseBase {
public:
    Task<T> get_return_object() noexcept;

    void unhandled_exception() noexcept {
        result_.set_exception(std::current_exception());
    }

    template<typename U>
    void return_value(U&& value) {
        result_.set_value(std::forward<U>(value));
    }

    ResultSlot<T>& result() noexcept {
        return result_;
    }

private:
    ResultSlot<T> result_;
};

template<>
class TaskPromise<void> : public PromiseBase {
public:
    Task<void> get_return_object() noexcept;

    void unhandled_exception() noexcept {
        result_.set_exception(std::current_exception());
    }

    void return_void() noexcept {}

    ResultSlot<void>& result() noexcept {
        return result_;
    }

private:
    ResultSlot<void> result_;
};

} // namespace detail

// ============================================================================
// Task<T> - lazy, move-only coroutine producing a single value
// ============================================================================

template<typename T>
class Task {
public:
    using promise_type = detail::TaskPromise<T>;
    using handle_type = coroutine_handle<promise_type>;
    using value_type = T;

    Task() noexcept = default;

    explicit Task(handle_type handle) noexcept : handle_(handle) {}

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    ~Task() {
        destroy();
    }

    PERSEVERE_NODISCARD bool valid() const noexcept {
        return handle_ != nullptr;
    }

    PERSEVERE_NODISCARD explicit operator bool() const noexcept {
        return valid();
    }

    PERSEVERE_NODISCARD bool done() const noexcept {
        return handle_ && handle_.done();
    }

    // co_await task; the value stays owned by the task
    auto operator co_await() const& noexcept {
        struct Awaiter : AwaiterBase {
            decltype(auto) await_resume() {
                PERSEVERE_ASSERT(this->handle);
                return this->handle.promise().result().get();
            }
        };
        return Awaiter{{handle_}};
    }

    // co_await std::move(task); the value is moved out
    auto operator co_await() && noexcept {
        struct Awaiter : AwaiterBase {
            T await_resume() {
                PERSEVERE_ASSERT(this->handle);
                return this->handle.promise().result().take();
            }
        };
        return Awaiter{{handle_}};
    }

private:
    struct AwaiterBase {
        handle_type handle;

        bool await_ready() const noexcept {
            return !handle || handle.done();
        }

        coroutine_handle<> await_suspend(coroutine_handle<> awaiting) noexcept {
            handle.promise().set_continuation(awaiting);
            return handle;
        }
    };

    void destroy() noexcept {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    handle_type handle_{nullptr};
};

namespace detail {

template<typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{coroutine_handle<TaskPromise>::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{coroutine_handle<TaskPromise>::from_promise(*this)};
}

// One-shot flag a blocked thread waits on
class BlockingSignal {
public:
    void set() {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_{false};
};

// Driver coroutine for sync_wait: signals the blocked thread from final_suspend
class SyncWaitDriver {
public:
    struct promise_type {
        BlockingSignal* signal{nullptr};

        SyncWaitDriver get_return_object() noexcept {
            return SyncWaitDriver{coroutine_handle<promise_type>::from_promise(*this)};
        }

        suspend_always initial_suspend() const noexcept { return {}; }

        auto final_suspend() const noexcept {
            struct Notify {
                bool await_ready() const noexcept { return false; }

                void await_suspend(coroutine_handle<promise_type> finished) const noexcept {
                    finished.promise().signal->set();
                }

                void await_resume() const noexcept {}
            };
            return Notify{};
        }

        void return_void() noexcept {}

        // The driver body captures every exception into its ResultSlot
        void unhandled_exception() noexcept {
            std::terminate();
        }
    };

    explicit SyncWaitDriver(coroutine_handle<promise_type> handle) noexcept : handle_(handle) {}

    SyncWaitDriver(SyncWaitDriver&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    SyncWaitDriver(const SyncWaitDriver&) = delete;
    SyncWaitDriver& operator=(const SyncWaitDriver&) = delete;
    SyncWaitDriver& operator=(SyncWaitDriver&&) = delete;

    ~SyncWaitDriver() {
        if (handle_) {
            handle_.destroy();
        }
    }

    void run(BlockingSignal& signal) {
        handle_.promise().signal = &signal;
        handle_.resume();
        signal.wait();
    }

private:
    coroutine_handle<promise_type> handle_;
};

template<typename T>
SyncWaitDriver drive(Task<T> task, ResultSlot<T>& slot) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(task);
            slot.set_value();
        } else {
            slot.set_value(co_await std::move(task));
        }
    } catch (...) {
        slot.set_exception(std::current_exception());
    }
}

} // namespace detail

// Run a task to completion, blocking the calling thread. The task may finish
// on another thread (timer or pool worker); the caller is woken when it does.
template<typename T>
T sync_wait(Task<T> task) {
    PERSEVERE_ASSERT(task.valid());

    detail::ResultSlot<T> slot;
    detail::BlockingSignal signal;
    auto driver = detail::drive(std::move(task), slot);
    driver.run(signal);
    return slot.take();
}

template<typename T>
Task<T> make_ready_task(T value) {
    co_return std::move(value);
}

inline Task<void> make_ready_task() {
    co_return;
}

// Task that fails with `exception` when awaited
template<typename T, typename E>
Task<T> make_exceptional_task(E exception) {
    co_await make_ready_task();
    throw std::move(exception);
}

} // namespace persevere

#endif // PERSEVERE_TASK_HPP
