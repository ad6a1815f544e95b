// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines
//
// A header-only C++20 library for running asynchronous operations with
// bounded retries, a per-attempt timeout and cooperative cancellation:
//   - invoke(): retry on timeout, stop on caller cancellation or failure
//   - CancellationSource / CancellationToken: linked and timed cancellation
//   - delay(): cancellable sleep for coroutines
//   - Task<T> and sync_wait(): lazy coroutines and a blocking bridge
//   - TimerService and ThreadPool backing the above
//
// Quick Start:
//
//   #include <persevere/persevere.hpp>
//   using namespace std::chrono_literals;
//
//   persevere::Task<std::string> fetch(persevere::CancellationToken token) {
//       co_await persevere::delay(50ms, token);   // honours timeout and cancellation
//       co_return "payload";
//   }
//
//   int main() {
//       persevere::CancellationSource shutdown;
//       auto result = persevere::sync_wait(
//           persevere::invoke(fetch, 3, 200ms, shutdown.token()));
//       if (result) {
//           std::cout << result.value() << "\n";
//       }
//   }
//
// Requires C++20 with coroutine support. Logging goes through {fmt}; set
// PERSEVERE_LOG_LEVEL=info to see retries on stderr.

#ifndef PERSEVERE_HPP
#define PERSEVERE_HPP

#include "config.hpp"
#include "log.hpp"
#include "errors.hpp"
#include "task.hpp"
#include "executor.hpp"
#include "timer.hpp"
#include "cancellation.hpp"
#include "delay.hpp"
#include "retry.hpp"

#endif // PERSEVERE_HPP
