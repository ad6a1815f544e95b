// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_ERRORS_HPP
#define PERSEVERE_ERRORS_HPP

#include "config.hpp"

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace persevere {

// ============================================================================
// ErrorKind - terminal classification of a failed invocation
// ============================================================================

enum class ErrorKind {
    Cancelled = 1,  // the caller's token was cancelled
    TimedOut,       // every attempt hit its timeout
    Failed,         // the operation threw something other than a cancellation
};

inline std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::TimedOut:
        return "timed out";
    case ErrorKind::Failed:
        return "failed";
    }
    return "unknown";
}

namespace detail {

class ErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "persevere";
    }

    std::string message(int value) const override {
        return std::string(to_string(static_cast<ErrorKind>(value)));
    }
};

} // namespace detail

inline const std::error_category& error_category() noexcept {
    static const detail::ErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ErrorKind kind) noexcept {
    return {static_cast<int>(kind), error_category()};
}

} // namespace persevere

namespace std {
template<>
struct is_error_code_enum<persevere::ErrorKind> : true_type {};
} // namespace std

namespace persevere {

// ============================================================================
// Exceptions
// ============================================================================

// Thrown by cancellation-aware code once the token it observes is cancelled
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled()
        : std::runtime_error("operation was cancelled") {}

    explicit OperationCancelled(const std::string& what)
        : std::runtime_error(what) {}
};

class RetryExhausted : public std::runtime_error {
public:
    explicit RetryExhausted(std::size_t attempts)
        : std::runtime_error("retry loop exhausted after " + std::to_string(attempts) + " attempt(s)") {}
};

class InvalidPolicy : public std::invalid_argument {
public:
    explicit InvalidPolicy(const std::string& what)
        : std::invalid_argument(what) {}
};

// Best-effort description of a captured exception
inline std::string describe_exception(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

// Raised when the value of an unsuccessful invocation is requested
class InvocationError : public std::system_error {
public:
    InvocationError(ErrorKind kind, std::size_t attempts, std::exception_ptr cause)
        : std::system_error(make_error_code(kind), summary(kind, attempts, cause))
        , kind_(kind)
        , attempts_(attempts)
        , cause_(std::move(cause)) {}

    PERSEVERE_NODISCARD ErrorKind kind() const noexcept {
        return kind_;
    }

    PERSEVERE_NODISCARD std::size_t attempts() const noexcept {
        return attempts_;
    }

    PERSEVERE_NODISCARD const std::exception_ptr& cause() const noexcept {
        return cause_;
    }

private:
    static std::string summary(ErrorKind kind, std::size_t attempts, const std::exception_ptr& cause) {
        std::string text = "invocation " + std::string(to_string(kind)) +
                           " after " + std::to_string(attempts) + " attempt(s)";
        if (cause) {
            text += " (" + describe_exception(cause) + ")";
        }
        return text;
    }

    ErrorKind kind_;
    std::size_t attempts_;
    std::exception_ptr cause_;
};

} // namespace persevere

#endif // PERSEVERE_ERRORS_HPP
