// SPDX-License-Identifier: GPL-3.0-or-later
// Persevere - Resilient invocation for C++ coroutines

#ifndef PERSEVERE_LOG_HPP
#define PERSEVERE_LOG_HPP

#include "config.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace persevere {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

inline std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "?";
}

// Accepts debug, info, warn/warning, error, off in any case
inline std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Backends
// ============================================================================

struct LogEvent {
    LogLevel level;
    std::string_view component;
    std::string message;
};

class ILogBackend {
public:
    virtual ~ILogBackend() = default;

    virtual LogLevel min_level() const noexcept = 0;
    virtual void log(const LogEvent& event) = 0;
};

// Writes one tab-separated line per event: level, component, thread, message
class OstreamLogBackend : public ILogBackend {
public:
    explicit OstreamLogBackend(LogLevel min_level, std::ostream& out = std::clog)
        : min_level_(min_level)
        , out_(out) {}

    LogLevel min_level() const noexcept override {
        return min_level_;
    }

    void log(const LogEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << to_string(event.level) << '\t' << event.component << '\t'
             << std::this_thread::get_id() << '\t' << event.message << std::endl;
    }

private:
    const LogLevel min_level_;
    std::ostream& out_;
    std::mutex mutex_;
};

namespace detail {

inline LogLevel log_level_from_environment() {
    const char* value = std::getenv(PERSEVERE_LOG_LEVEL_ENV);
    if (value == nullptr) {
        return LogLevel::Warning;
    }
    return parse_log_level(value).value_or(LogLevel::Warning);
}

struct LogRegistry {
    std::mutex mutex;
    std::shared_ptr<ILogBackend> backend;
};

inline LogRegistry& log_registry() {
    static LogRegistry registry;
    return registry;
}

} // namespace detail

// Replace the process-wide backend. nullptr restores the default stderr backend.
inline void set_log_backend(std::shared_ptr<ILogBackend> backend) {
    auto& registry = detail::log_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.backend = std::move(backend);
}

inline std::shared_ptr<ILogBackend> log_backend() {
    auto& registry = detail::log_registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    if (!registry.backend) {
        registry.backend = std::make_shared<OstreamLogBackend>(detail::log_level_from_environment());
    }
    return registry.backend;
}

// ============================================================================
// Logger - component-tagged front end, formats with {fmt}
// ============================================================================

class Logger {
public:
    explicit Logger(std::string component)
        : component_(std::move(component)) {
        // Constructed first, destroyed last: long-lived owners may log while shutting down
        (void)detail::log_registry();
    }

    PERSEVERE_NODISCARD bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= log_backend()->min_level();
    }

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) const {
        if (level == LogLevel::Off) {
            return;
        }
        auto backend = log_backend();
        if (level < backend->min_level()) {
            return;
        }
        backend->log(LogEvent{level, component_, fmt::format(format, std::forward<Args>(args)...)});
    }

    PERSEVERE_NODISCARD const std::string& component() const noexcept {
        return component_;
    }

private:
    std::string component_;
};

} // namespace persevere

#define PERSEVERE_LOG_DEBUG(logger, ...) (logger).log(::persevere::LogLevel::Debug, __VA_ARGS__)
#define PERSEVERE_LOG_INFO(logger, ...) (logger).log(::persevere::LogLevel::Info, __VA_ARGS__)
#define PERSEVERE_LOG_WARN(logger, ...) (logger).log(::persevere::LogLevel::Warning, __VA_ARGS__)
#define PERSEVERE_LOG_ERROR(logger, ...) (logger).log(::persevere::LogLevel::Error, __VA_ARGS__)

#endif // PERSEVERE_LOG_HPP
