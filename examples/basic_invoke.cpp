// Basic invoke() example - retrying an operation that sometimes hangs
// Compile: g++ -std=c++20 -I../include basic_invoke.cpp -o basic_invoke -lfmt -pthread

#include <persevere/persevere.hpp>
#include <iostream>
#include <string>
#include <chrono>

using namespace std::chrono_literals;

// Hangs on the first two calls, answers on the third
int fetch_calls = 0;
persevere::Task<std::string> fetch_profile(persevere::CancellationToken token) {
    ++fetch_calls;
    std::cout << "  fetch_profile call " << fetch_calls << "\n";

    if (fetch_calls < 3) {
        co_await persevere::delay(10s, token);
    }
    co_await persevere::delay(20ms, token);
    co_return "profile#42";
}

persevere::Task<int> parse_number(const std::string& text) {
    co_return std::stoi(text);
}

int main() {
    std::cout << "=== invoke() Examples ===\n";

    // Example 1: success after two timed-out attempts
    std::cout << "\n1. Retry on timeout:\n";
    {
        auto result = persevere::sync_wait(persevere::invoke(fetch_profile, 3, 100ms));

        if (result) {
            std::cout << "  Got " << result.value() << " after " << result.attempts() << " attempts\n";
        }
    }

    // Example 2: every attempt times out
    std::cout << "\n2. Retries exhausted:\n";
    {
        auto hang = [](persevere::CancellationToken token) -> persevere::Task<int> {
            co_await persevere::delay(1s, token);
            co_return 0;
        };

        auto result = persevere::sync_wait(persevere::invoke(hang, 2, 50ms));
        std::cout << "  Error: " << result.error_code().message()
                  << " (" << result.attempts() << " attempts)\n";
    }

    // Example 3: a failure is reported at once, never retried
    std::cout << "\n3. Non-timeout failure:\n";
    {
        int calls = 0;
        auto parse = [&calls]() -> persevere::Task<int> {
            ++calls;
            co_return co_await parse_number("not a number");
        };

        auto result = persevere::sync_wait(persevere::invoke(parse, 5, 1s));
        std::cout << "  Failed after " << calls << " call: "
                  << persevere::describe_exception(result.cause()) << "\n";
    }

    // Example 4: value() throws for unsuccessful results
    std::cout << "\n4. value() on an error:\n";
    {
        auto hang = [](persevere::CancellationToken token) -> persevere::Task<int> {
            co_await persevere::delay(1s, token);
            co_return 0;
        };

        auto result = persevere::sync_wait(persevere::invoke(hang, 1, 20ms));
        try {
            std::cout << "  Value: " << result.value() << "\n";
        } catch (const persevere::InvocationError& e) {
            std::cout << "  Caught: " << e.what() << "\n";
        }
    }

    std::cout << "\n=== All examples completed ===\n";
    return 0;
}
