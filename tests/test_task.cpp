// Tests for Task<T> and sync_wait

#include <persevere/persevere.hpp>
#include <type_traits>
#include <string>
#include <stdexcept>
#include <thread>

// Test framework declarations (defined in test_main.cpp)
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

namespace {

persevere::Task<int> answer(int value) {
    co_return value;
}

persevere::Task<int> add(int a, int b) {
    auto left = co_await answer(a);
    auto right = co_await answer(b);
    co_return left + right;
}

persevere::Task<int> broken() {
    throw std::runtime_error("task error");
    co_return 0;
}

} // namespace

TEST(task_returns_value) {
    CHECK_EQ(persevere::sync_wait(answer(42)), 42);
}

TEST(task_returns_string) {
    auto greet = []() -> persevere::Task<std::string> {
        co_return "hello";
    };
    CHECK(persevere::sync_wait(greet()) == "hello");
}

TEST(task_void_runs_body) {
    bool ran = false;
    auto body = [&]() -> persevere::Task<void> {
        ran = true;
        co_return;
    };
    persevere::sync_wait(body());
    CHECK(ran);
}

TEST(task_is_lazy) {
    bool started = false;
    auto body = [&]() -> persevere::Task<int> {
        started = true;
        co_return 1;
    };
    auto task = body();
    CHECK(!started);
    CHECK(!task.done());
    persevere::sync_wait(std::move(task));
    CHECK(started);
}

TEST(task_chaining) {
    CHECK_EQ(persevere::sync_wait(add(10, 20)), 30);
}

TEST(task_exception_propagates) {
    bool caught = false;
    try {
        persevere::sync_wait(broken());
    } catch (const std::runtime_error& e) {
        caught = true;
        CHECK(std::string(e.what()) == "task error");
    }
    CHECK(caught);
}

TEST(task_move_semantics) {
    auto first = answer(100);
    CHECK(first.valid());

    auto second = std::move(first);
    CHECK(!first.valid());
    CHECK(second.valid());

    CHECK_EQ(persevere::sync_wait(std::move(second)), 100);
}

TEST(task_lvalue_await_keeps_value) {
    auto outer = []() -> persevere::Task<std::string> {
        auto inner = []() -> persevere::Task<std::string> {
            co_return "kept";
        }();
        std::string& first = co_await inner;
        co_return first + "/" + (inner.done() ? "done" : "pending");
    };
    CHECK(persevere::sync_wait(outer()) == "kept/done");
}

TEST(task_ready_helpers) {
    CHECK_EQ(persevere::sync_wait(persevere::make_ready_task(55)), 55);
    persevere::sync_wait(persevere::make_ready_task());

    bool caught = false;
    try {
        persevere::sync_wait(persevere::make_exceptional_task<int>(std::logic_error("nope")));
    } catch (const std::logic_error&) {
        caught = true;
    }
    CHECK(caught);
}

TEST(sync_wait_finishes_on_other_thread) {
    persevere::ThreadPool pool(1);
    auto caller = std::this_thread::get_id();

    auto hop = [&]() -> persevere::Task<bool> {
        co_await pool.schedule_on();
        co_return std::this_thread::get_id() != caller;
    };

    CHECK(persevere::sync_wait(hop()));
}
