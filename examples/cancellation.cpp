// Cancellation example - caller tokens, linked sources and timed cancellation
// Compile: g++ -std=c++20 -I../include cancellation.cpp -o cancellation -lfmt -pthread

#include <persevere/persevere.hpp>
#include <iostream>
#include <chrono>

using namespace std::chrono_literals;

// Polls its token between chunks of work
persevere::Task<int> long_running(persevere::CancellationToken token) {
    int done = 0;
    for (int i = 0; i < 10; ++i) {
        token.throw_if_cancellation_requested();
        std::cout << "  Working... " << (i + 1) << "/10\n";
        co_await persevere::delay(50ms, token);
        ++done;
    }
    co_return done;
}

int main() {
    std::cout << "=== Cancellation Examples ===\n";

    // Example 1: cancel_after on a plain source
    std::cout << "\n1. cancel_after():\n";
    {
        persevere::CancellationSource source;
        source.cancel_after(120ms);

        try {
            auto chunks = persevere::sync_wait(long_running(source.token()));
            std::cout << "  Completed " << chunks << " chunks\n";
        } catch (const persevere::OperationCancelled&) {
            std::cout << "  Operation was cancelled\n";
        }
    }

    // Example 2: a linked source follows either parent
    std::cout << "\n2. Linked sources:\n";
    {
        persevere::CancellationSource user;
        persevere::CancellationSource shutdown;
        auto linked = persevere::CancellationSource::linked(user.token(), shutdown.token());

        auto registration = linked.token().register_callback([] {
            std::cout << "  Linked token cancelled\n";
        });

        shutdown.cancel();
        std::cout << "  user cancelled: " << std::boolalpha << user.is_cancellation_requested() << "\n";
    }

    // Example 3: caller cancellation ends invoke() without further retries
    std::cout << "\n3. Cancelling invoke():\n";
    {
        persevere::CancellationSource source;
        source.cancel_after(150ms);

        auto result = persevere::sync_wait(persevere::invoke(long_running, 3, 1s, source.token()));
        std::cout << "  Result: " << result.error_code().message()
                  << " during attempt " << result.attempts() << "\n";
    }

    // Example 4: already cancelled - nothing runs
    std::cout << "\n4. Pre-cancelled token:\n";
    {
        persevere::CancellationSource source;
        source.cancel();

        auto result = persevere::sync_wait(persevere::invoke(long_running, 3, 1s, source.token()));
        std::cout << "  Result: " << result.error_code().message()
                  << ", attempts made: " << result.attempts() << "\n";
    }

    std::cout << "\n=== All examples completed ===\n";
    return 0;
}
