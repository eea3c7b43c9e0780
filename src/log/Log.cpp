#include "lumen/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace lumen::log {

namespace {

LogHandler makeDefaultHandler() {
    return [](LogLevel level, std::string_view message) {
        auto& stream = (level == LogLevel::Info) ? std::cout : std::cerr;
        stream << message;
        stream.flush();
    };
}

std::mutex handlerMutex;
LogHandler handler = makeDefaultHandler();
std::atomic<LogLevel> threshold{LogLevel::Info};

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "unknown";
}

void setLogHandler(LogHandler newHandler) {
    std::lock_guard lock(handlerMutex);
    handler = newHandler ? std::move(newHandler) : makeDefaultHandler();
}

void resetLogHandler() {
    std::lock_guard lock(handlerMutex);
    handler = makeDefaultHandler();
}

void setMinimumLevel(LogLevel level) {
    threshold.store(level, std::memory_order_relaxed);
}

LogLevel minimumLevel() {
    return threshold.load(std::memory_order_relaxed);
}

namespace detail {

void write(LogLevel level, std::string_view message) {
    if (level < minimumLevel()) {
        return;
    }
    LogHandler current;
    {
        std::lock_guard lock(handlerMutex);
        current = handler;
    }
    // Call outside the lock so a sink may itself log without deadlocking.
    if (current) {
        current(level, message);
    }
}

} // namespace detail

void logInfo(std::string_view message) {
    detail::write(LogLevel::Info, message);
}

void logWarning(std::string_view message) {
    detail::write(LogLevel::Warning, message);
}

void logError(std::string_view message) {
    detail::write(LogLevel::Error, message);
}

} // namespace lumen::log
