// Tests for the cancellable delay awaiter

#include <persevere/persevere.hpp>
#include <type_traits>
#include <chrono>
#include <string>

// Test framework declarations
namespace test {
    int register_test(const std::string& name, std::function<void()> func);
    void check(bool condition, const std::string& message, const char* file, int line);

    template<typename A, typename B>
    void check_equal(const A& a, const B& b, const char* expr, const char* file, int line) {
        std::string message(expr);
        bool equal = (a == b);
        if constexpr (std::is_arithmetic_v<A> && std::is_arithmetic_v<B>) {
            if (!equal) {
                message += " (got " + std::to_string(a) + " vs " + std::to_string(b) + ")";
            }
        }
        check(equal, message, file, line);
    }
}

#define TEST(name) \
    void test_##name(); \
    static int test_##name##_registered = test::register_test(#name, test_##name); \
    void test_##name()

#define CHECK(cond) test::check(cond, #cond, __FILE__, __LINE__)
#define CHECK_EQ(a, b) test::check_equal((a), (b), #a " == " #b, __FILE__, __LINE__)

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

// Milliseconds spent in delay(), or -1 if it was cancelled
persevere::Task<long> timed_delay(std::chrono::milliseconds duration, persevere::CancellationToken token) {
    auto start = Clock::now();
    try {
        co_await persevere::delay(duration, token);
    } catch (const persevere::OperationCancelled&) {
        co_return -1;
    }
    co_return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}

} // namespace

TEST(delay_waits_at_least_duration) {
    auto elapsed = persevere::sync_wait(timed_delay(50ms, {}));
    CHECK(elapsed >= 50);
}

TEST(delay_zero_completes_immediately) {
    auto elapsed = persevere::sync_wait(timed_delay(0ms, {}));
    CHECK(elapsed >= 0);
    CHECK(elapsed < 50);
}

TEST(delay_with_cancelled_token_throws) {
    persevere::CancellationSource source;
    source.cancel();

    CHECK_EQ(persevere::sync_wait(timed_delay(10s, source.token())), -1L);
    CHECK_EQ(persevere::sync_wait(timed_delay(0ms, source.token())), -1L);
}

TEST(delay_cancelled_while_waiting) {
    persevere::CancellationSource source;
    source.cancel_after(30ms);

    auto start = Clock::now();
    auto result = persevere::sync_wait(timed_delay(10s, source.token()));

    CHECK_EQ(result, -1L);
    CHECK(Clock::now() - start < 2s);
}

TEST(delay_unrepresentable_duration_waits_for_cancel) {
    persevere::CancellationSource source;
    source.cancel_after(30ms);

    auto start = Clock::now();
    auto result = persevere::sync_wait(timed_delay(std::chrono::milliseconds::max(), source.token()));

    CHECK_EQ(result, -1L);
    CHECK(Clock::now() - start >= 30ms);
}

TEST(delay_uncancelled_token_completes) {
    persevere::CancellationSource source;
    auto elapsed = persevere::sync_wait(timed_delay(30ms, source.token()));

    CHECK(elapsed >= 30);
    CHECK(!source.is_cancellation_requested());
}

TEST(delay_leaves_no_timers_behind) {
    persevere::TimerService timers;
    persevere::ThreadPool pool(1);
    persevere::CancellationSource source;
    source.cancel_after(20ms, timers);

    auto body = [&]() -> persevere::Task<bool> {
        try {
            co_await persevere::delay(10s, source.token(), timers, pool);
        } catch (const persevere::OperationCancelled&) {
            co_return true;
        }
        co_return false;
    };

    CHECK(persevere::sync_wait(body()));
    CHECK_EQ(timers.pending(), 0u);
}

TEST(delay_sequence_accumulates) {
    auto body = []() -> persevere::Task<long> {
        auto start = Clock::now();
        for (int i = 0; i < 3; ++i) {
            co_await persevere::delay(20ms);
        }
        co_return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
    };

    CHECK(persevere::sync_wait(body()) >= 60);
}
