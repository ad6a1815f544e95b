// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_EXECUTOR_HPP
#define PERSEVERE_EXECUTOR_HPP

#include "config.hpp"
#include "log.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace persevere {

// ============================================================================
// ThreadPool - resumes suspended coroutines and runs posted callbacks
// ============================================================================
//
// Timer expirations and cancellations never resume a coroutine inline; they
// post its handle here so the timer thread and the cancelling thread stay free.

class ThreadPool {
public:
    explicit ThreadPool(std::size_t num_threads = std::thread::hardware_concurrency())
        : logger_("persevere.pool") {
        if (num_threads == 0) {
            num_threads = 1;
        }

        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        stop();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a coroutine to be resumed on a worker. Returns false once stopped.
    bool schedule(coroutine_handle<> handle) {
        if (!handle) {
            return false;
        }
        return enqueue([handle] { handle.resume(); });
    }

    // Queue a callable. Returns false once stopped.
    template<typename F>
    bool execute(F&& func) {
        return enqueue(std::function<void()>(std::forward<F>(func)));
    }

    // co_await pool.schedule_on() continues the coroutine on a worker
    auto schedule_on() {
        struct ScheduleAwaiter {
            ThreadPool& pool;

            bool await_ready() const noexcept { return false; }

            bool await_suspend(coroutine_handle<> handle) {
                return pool.schedule(handle);
            }

            void await_resume() const noexcept {}
        };
        return ScheduleAwaiter{*this};
    }

    // Finish queued work, then join the workers. Work posted afterwards is refused.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            stopped_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (!worker.joinable()) {
                continue;
            }
            if (worker.get_id() == std::this_thread::get_id()) {
                worker.detach();
            } else {
                worker.join();
            }
        }
    }

    PERSEVERE_NODISCARD bool is_stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    PERSEVERE_NODISCARD std::size_t size() const noexcept {
        return workers_.size();
    }

    PERSEVERE_NODISCARD std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

private:
    bool enqueue(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return false;
            }
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
        return true;
    }

    void worker_loop() {
        while (true) {
            std::function<void()> job;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopped_ || !jobs_.empty(); });

                if (jobs_.empty()) {
                    return;
                }

                job = std::move(jobs_.front());
                jobs_.pop_front();
            }

            try {
                job();
            } catch (const std::exception& e) {
                PERSEVERE_LOG_ERROR(logger_, "pool job threw: {}", e.what());
            } catch (...) {
                PERSEVERE_LOG_ERROR(logger_, "pool job threw: non-standard exception");
            }
        }
    }

    Logger logger_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    bool stopped_{false};
};

// Resume on a specific executor
template<typename Executor>
auto resume_on(Executor& executor) {
    return executor.schedule_on();
}

namespace detail {
    inline ThreadPool& get_global_pool() {
        static ThreadPool pool;
        return pool;
    }
}

// Process-wide pool used when no executor is passed explicitly
inline ThreadPool& global_pool() {
    return detail::get_global_pool();
}

} // namespace persevere

#endif // PERSEVERE_EXECUTOR_HPP
