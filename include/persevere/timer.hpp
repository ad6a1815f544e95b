// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_TIMER_HPP
#define PERSEVERE_TIMER_HPP

#include "config.hpp"
#include "log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ratio>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace persevere {

namespace detail {

// Deadline queue shared by a TimerService and the handles it gives out
struct TimerQueue {
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<Clock::time_point, std::uint64_t>;

    std::mutex mutex;
    std::condition_variable cv;
    std::map<Key, std::function<void()>> entries;
    std::unordered_map<std::uint64_t, Clock::time_point> deadlines;
    std::uint64_t next_id{1};
    bool stopped{false};

    bool cancel(std::uint64_t id) {
        std::function<void()> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = deadlines.find(id);
            if (it == deadlines.end()) {
                return false;
            }
            auto entry = entries.find(Key{it->second, id});
            dropped = std::move(entry->second);
            entries.erase(entry);
            deadlines.erase(it);
        }
        return true;
    }
};

// ceil<To>(d), clamped to To's range instead of overflowing
template<typename To, typename Rep, typename Period>
To saturating_ceil(std::chrono::duration<Rep, Period> d) {
    using From = std::chrono::duration<Rep, Period>;
    if constexpr (std::ratio_greater<Period, typename To::period>::value ||
                  std::chrono::treat_as_floating_point<Rep>::value) {
        if (d >= std::chrono::duration_cast<From>(To::max())) {
            return To::max();
        }
        if (d <= std::chrono::duration_cast<From>(To::min())) {
            return To::min();
        }
    }
    return std::chrono::ceil<To>(d);
}

} // namespace detail

// ============================================================================
// TimerHandle - cancels its timer when dropped
// ============================================================================

class TimerHandle {
public:
    TimerHandle() noexcept = default;

    TimerHandle(std::weak_ptr<detail::TimerQueue> queue, std::uint64_t id) noexcept
        : queue_(std::move(queue))
        , id_(id) {}

    TimerHandle(TimerHandle&& other) noexcept
        : queue_(std::move(other.queue_))
        , id_(std::exchange(other.id_, 0)) {}

    TimerHandle& operator=(TimerHandle&& other) noexcept {
        if (this != &other) {
            cancel();
            queue_ = std::move(other.queue_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    TimerHandle(const TimerHandle&) = delete;
    TimerHandle& operator=(const TimerHandle&) = delete;

    ~TimerHandle() {
        cancel();
    }

    // True if the timer was still pending and will now never fire.
    // Does not wait for a callback that is already running.
    bool cancel() noexcept {
        if (id_ == 0) {
            return false;
        }
        auto id = std::exchange(id_, 0);
        auto queue = queue_.lock();
        queue_.reset();
        return queue && queue->cancel(id);
    }

    PERSEVERE_NODISCARD bool valid() const noexcept {
        return id_ != 0;
    }

private:
    std::weak_ptr<detail::TimerQueue> queue_;
    std::uint64_t id_{0};
};

// ============================================================================
// TimerService - one thread firing callbacks at their deadlines
// ============================================================================
//
// Callbacks run on the timer thread, outside the queue lock, in deadline
// order (registration order for equal deadlines). They must be short:
// anything substantial belongs on a ThreadPool.

class TimerService {
public:
    using Clock = detail::TimerQueue::Clock;

    TimerService()
        : logger_("persevere.timer")
        , queue_(std::make_shared<detail::TimerQueue>()) {
        worker_ = std::thread([this] { run(); });
    }

    ~TimerService() {
        stop();
    }

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    PERSEVERE_NODISCARD TimerHandle schedule_at(Clock::time_point deadline, std::function<void()> callback) {
        std::uint64_t id = 0;
        bool earliest = false;
        {
            std::lock_guard<std::mutex> lock(queue_->mutex);
            if (queue_->stopped) {
                throw std::runtime_error("timer service is stopped");
            }
            id = queue_->next_id++;
            auto inserted = queue_->entries.emplace(detail::TimerQueue::Key{deadline, id}, std::move(callback));
            queue_->deadlines.emplace(id, deadline);
            earliest = inserted.first == queue_->entries.begin();
        }
        if (earliest) {
            queue_->cv.notify_one();
        }
        return TimerHandle{queue_, id};
    }

    template<typename Rep, typename Period>
    PERSEVERE_NODISCARD TimerHandle schedule_after(std::chrono::duration<Rep, Period> delay,
                                                   std::function<void()> callback) {
        auto now = Clock::now();
        auto step = detail::saturating_ceil<Clock::duration>(delay);
        // Beyond the clock's range: parked at max() and never fires
        auto deadline = step >= Clock::time_point::max() - now ? Clock::time_point::max() : now + step;
        return schedule_at(deadline, std::move(callback));
    }

    // Drops pending timers without running them and joins the thread
    void stop() {
        std::map<detail::TimerQueue::Key, std::function<void()>> dropped;
        {
            std::lock_guard<std::mutex> lock(queue_->mutex);
            if (queue_->stopped) {
                return;
            }
            queue_->stopped = true;
            dropped.swap(queue_->entries);
            queue_->deadlines.clear();
        }
        queue_->cv.notify_all();

        if (!dropped.empty()) {
            PERSEVERE_LOG_DEBUG(logger_, "stopping with {} pending timer(s)", dropped.size());
        }

        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

    PERSEVERE_NODISCARD bool is_stopped() const {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        return queue_->stopped;
    }

    PERSEVERE_NODISCARD std::size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        return queue_->entries.size();
    }

private:
    void run() {
        auto queue = queue_;
        std::unique_lock<std::mutex> lock(queue->mutex);

        while (!queue->stopped) {
            if (queue->entries.empty()) {
                queue->cv.wait(lock, [&] { return queue->stopped || !queue->entries.empty(); });
                continue;
            }

            auto first = queue->entries.begin();
            auto deadline = first->first.first;
            if (deadline == Clock::time_point::max()) {
                queue->cv.wait(lock);
                continue;
            }
            if (Clock::now() < deadline) {
                queue->cv.wait_until(lock, deadline);
                continue;
            }

            auto callback = std::move(first->second);
            queue->deadlines.erase(first->first.second);
            queue->entries.erase(first);

            lock.unlock();
            fire(callback);
            callback = nullptr;
            lock.lock();
        }
    }

    void fire(std::function<void()>& callback) {
        try {
            callback();
        } catch (const std::exception& e) {
            PERSEVERE_LOG_ERROR(logger_, "timer callback threw: {}", e.what());
        } catch (...) {
            PERSEVERE_LOG_ERROR(logger_, "timer callback threw: non-standard exception");
        }
    }

    Logger logger_;
    std::shared_ptr<detail::TimerQueue> queue_;
    std::thread worker_;
};

namespace detail {
    inline TimerService& get_global_timer() {
        static TimerService timers;
        return timers;
    }
}

// Process-wide timer service used when none is passed explicitly
inline TimerService& global_timer() {
    return detail::get_global_timer();
}

} // namespace persevere

#endif // PERSEVERE_TIMER_HPP
