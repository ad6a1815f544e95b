// Policy example - custom backoff and per-attempt reporting
// Compile: g++ -std=c++20 -I../include observer.cpp -o observer -lfmt -pthread
// Run with PERSEVERE_LOG_LEVEL=info to also see the library's own log lines.

#include <persevere/persevere.hpp>
#include <iostream>
#include <chrono>

using namespace std::chrono_literals;

int attempt_counter = 0;
persevere::Task<int> flaky_service(persevere::CancellationToken token) {
    attempt_counter++;
    if (attempt_counter < 4) {
        co_await persevere::delay(5s, token);
    }
    co_return 100;
}

int main() {
    std::cout << "=== Policy Examples ===\n";

    auto report = [](const persevere::AttemptEvent& event) {
        std::cout << "  Attempt " << event.attempt << "/" << event.max_attempts << ": "
                  << persevere::to_string(event.outcome);
        if (event.backoff.count() > 0) {
            std::cout << ", retrying in " << event.backoff.count() << "ms";
        }
        std::cout << "\n";
    };

    // Example 1: exponential backoff
    std::cout << "\n1. Exponential backoff:\n";
    {
        auto policy = persevere::RetryPolicy{}
            .with_max_attempts(5)
            .with_attempt_timeout(50ms)
            .with_backoff(persevere::exponential_backoff(10ms, 2.0, 100ms));

        auto result = persevere::invoke_sync(flaky_service, policy, {}, report);
        std::cout << "  Final result: " << result.value() << "\n";
    }

    // Example 2: not enough attempts
    std::cout << "\n2. Giving up:\n";
    {
        attempt_counter = 0;
        auto policy = persevere::RetryPolicy{}
            .with_max_attempts(2)
            .with_attempt_timeout(30ms);

        auto result = persevere::invoke_sync(flaky_service, policy, {}, report);
        std::cout << "  Final result: " << result.error_code().message() << "\n";
    }

    // Example 3: rejected policy
    std::cout << "\n3. Invalid policy:\n";
    {
        try {
            auto result = persevere::invoke_sync(flaky_service, persevere::RetryPolicy{}.with_max_attempts(0));
            std::cout << "  Unexpected: " << result.ok() << "\n";
        } catch (const persevere::InvalidPolicy& e) {
            std::cout << "  Rejected: " << e.what() << "\n";
        }
    }

    std::cout << "\n=== All examples completed ===\n";
    return 0;
}
